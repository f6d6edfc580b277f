// File: KmlExporter.cpp
#include "KmlExporter.hpp"
#include <tinyxml2.h>

#include <sstream>
#include <iomanip>

namespace suitgeo {

    namespace {

        tinyxml2::XMLElement* addTextChild(tinyxml2::XMLDocument& doc, tinyxml2::XMLElement* parent, const char* name, const std::string& text) {
            tinyxml2::XMLElement* el = doc.NewElement(name);
            el->SetText(text.c_str());
            parent->InsertEndChild(el);
            return el;
        }

        std::string formatCoordinate(double v) {
            std::ostringstream ss;
            ss << std::setprecision(12) << v;
            return ss.str();
        }

        // "x,y,0" tuples, ring closed explicitly as KML requires
        std::string ringCoordinates(const std::vector<PointXY>& ring) {
            std::ostringstream ss;
            ss << std::setprecision(12);
            for (const auto& p : ring) ss << p.x << "," << p.y << ",0 ";
            if (!ring.empty()) ss << ring.front().x << "," << ring.front().y << ",0";
            return ss.str();
        }

        void addRing(tinyxml2::XMLDocument& doc, tinyxml2::XMLElement* polygonEl, const char* boundaryTag, const std::vector<PointXY>& ring) {
            tinyxml2::XMLElement* boundary = doc.NewElement(boundaryTag);
            tinyxml2::XMLElement* linearRing = doc.NewElement("LinearRing");
            addTextChild(doc, linearRing, "coordinates", ringCoordinates(ring));
            boundary->InsertEndChild(linearRing);
            polygonEl->InsertEndChild(boundary);
        }

        void addPolygonPlacemark(tinyxml2::XMLDocument& doc, tinyxml2::XMLElement* folder, const std::string& name,
            const std::string& description, const std::string& styleUrl, const Polygon& polygon) {
            tinyxml2::XMLElement* placemark = doc.NewElement("Placemark");
            addTextChild(doc, placemark, "name", name);
            if (!description.empty()) addTextChild(doc, placemark, "description", description);
            addTextChild(doc, placemark, "styleUrl", styleUrl);

            tinyxml2::XMLElement* polygonEl = doc.NewElement("Polygon");
            addRing(doc, polygonEl, "outerBoundaryIs", polygon.outer);
            for (const auto& hole : polygon.holes) addRing(doc, polygonEl, "innerBoundaryIs", hole);
            placemark->InsertEndChild(polygonEl);
            folder->InsertEndChild(placemark);
        }

        void addLineStyle(tinyxml2::XMLDocument& doc, tinyxml2::XMLElement* parent, const char* id, const char* lineColor, const char* fillColor) {
            tinyxml2::XMLElement* style = doc.NewElement("Style");
            style->SetAttribute("id", id);
            tinyxml2::XMLElement* line = doc.NewElement("LineStyle");
            addTextChild(doc, line, "color", lineColor);
            addTextChild(doc, line, "width", "2");
            style->InsertEndChild(line);
            tinyxml2::XMLElement* poly = doc.NewElement("PolyStyle");
            addTextChild(doc, poly, "color", fillColor);
            style->InsertEndChild(poly);
            parent->InsertEndChild(style);
        }

    } // anonymous namespace

    void writeKmlOverlay(const KmlOverlayInfo& info, const std::string& filePath) {
        if (!info.frame.isValid()) {
            throw OverlayError(ErrorKind::ExportFailed, "cannot georeference overlay without a valid frame");
        }

        tinyxml2::XMLDocument doc;
        doc.InsertFirstChild(doc.NewDeclaration("xml version=\"1.0\" encoding=\"UTF-8\""));
        tinyxml2::XMLElement* kml = doc.NewElement("kml");
        kml->SetAttribute("xmlns", "http://www.opengis.net/kml/2.2");
        doc.InsertEndChild(kml);

        tinyxml2::XMLElement* document = doc.NewElement("Document");
        kml->InsertEndChild(document);
        addTextChild(doc, document, "name", info.name);
        addLineStyle(doc, document, "extentStyle", "ffffffff", "00ffffff");
        addLineStyle(doc, document, "influenceStyle", "ff0000ff", "400000ff");

        // --- Cost image ---
        tinyxml2::XMLElement* overlay = doc.NewElement("GroundOverlay");
        addTextChild(doc, overlay, "name", info.name + " cost");
        tinyxml2::XMLElement* icon = doc.NewElement("Icon");
        addTextChild(doc, icon, "href", info.image_href);
        overlay->InsertEndChild(icon);

        const BoundingBox box = info.frame.extent();
        tinyxml2::XMLElement* latLonBox = doc.NewElement("LatLonBox");
        addTextChild(doc, latLonBox, "north", formatCoordinate(box.ymax));
        addTextChild(doc, latLonBox, "south", formatCoordinate(box.ymin));
        addTextChild(doc, latLonBox, "east", formatCoordinate(box.xmax));
        addTextChild(doc, latLonBox, "west", formatCoordinate(box.xmin));
        overlay->InsertEndChild(latLonBox);
        document->InsertEndChild(overlay);

        // --- Vector context ---
        if (info.extent || info.influence) {
            tinyxml2::XMLElement* folder = doc.NewElement("Folder");
            addTextChild(doc, folder, "name", "Zones");
            if (info.extent) {
                addPolygonPlacemark(doc, folder, "Processing extent", "", "#extentStyle", *info.extent);
            }
            if (info.influence) {
                addPolygonPlacemark(doc, folder, "Custom influence", info.influence_description, "#influenceStyle", *info.influence);
            }
            document->InsertEndChild(folder);
        }

        if (doc.SaveFile(filePath.c_str()) != tinyxml2::XML_SUCCESS) {
            throw OverlayError(ErrorKind::ExportFailed, "failed to save KML '" + filePath + "' - " + doc.ErrorStr());
        }
    }

} // namespace suitgeo
