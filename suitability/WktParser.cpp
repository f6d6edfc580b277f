// File: WktParser.cpp
#include "WktParser.hpp"

#include <cctype>
#include <cstdlib>
#include <set>
#include <utility>

namespace suitgeo {

    namespace {

        [[noreturn]] void fail(const std::string& what) {
            throw OverlayError(ErrorKind::InvalidGeometry, what);
        }

        // Minimal cursor over the WKT text
        class WktCursor {
        public:
            explicit WktCursor(const std::string& text) : text_(text) {}

            void skipSpace() {
                while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            }

            bool atEnd() {
                skipSpace();
                return pos_ >= text_.size();
            }

            bool accept(char c) {
                skipSpace();
                if (pos_ < text_.size() && text_[pos_] == c) {
                    ++pos_;
                    return true;
                }
                return false;
            }

            void expect(char c) {
                if (!accept(c)) {
                    fail(std::string("expected '") + c + "' at offset " + std::to_string(pos_));
                }
            }

            std::string word() {
                skipSpace();
                std::string w;
                while (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_]))) {
                    w += static_cast<char>(std::toupper(static_cast<unsigned char>(text_[pos_])));
                    ++pos_;
                }
                return w;
            }

            bool number(double& out) {
                skipSpace();
                if (pos_ >= text_.size()) return false;
                const char* begin = text_.c_str() + pos_;
                char* end = nullptr;
                out = std::strtod(begin, &end);
                if (end == begin || !std::isfinite(out)) return false;
                pos_ += static_cast<std::size_t>(end - begin);
                return true;
            }

        private:
            const std::string& text_;
            std::size_t pos_ = 0;
        };

        std::vector<PointXY> parseRing(WktCursor& cur, std::size_t ringIndex) {
            cur.expect('(');
            std::vector<PointXY> ring;
            do {
                PointXY p;
                if (!cur.number(p.x) || !cur.number(p.y)) {
                    fail("ring " + std::to_string(ringIndex) + ": expected 'x y' coordinate pair");
                }
                double extra = 0.0;
                while (cur.number(extra)) {} // Z and M ordinates are ignored
                ring.push_back(p);
            } while (cur.accept(','));
            cur.expect(')');

            if (ring.size() < 4) {
                fail("ring " + std::to_string(ringIndex) + " has " + std::to_string(ring.size()) + " vertices, at least 4 required");
            }
            const PointXY& first = ring.front();
            const PointXY& last = ring.back();
            if (first.x != last.x || first.y != last.y) {
                fail("ring " + std::to_string(ringIndex) + " is not closed");
            }
            ring.pop_back();

            std::set<std::pair<double, double>> distinct;
            for (const auto& p : ring) distinct.emplace(p.x, p.y);
            if (distinct.size() < 3) {
                fail("ring " + std::to_string(ringIndex) + " has fewer than 3 distinct vertices");
            }
            return ring;
        }

    } // anonymous namespace

    Polygon parsePolygonWkt(const std::string& wkt) {
        WktCursor cur(wkt);
        const std::string keyword = cur.word();
        if (keyword != "POLYGON") {
            fail(keyword.empty() ? std::string("empty or non-WKT boundary") : "unsupported geometry type '" + keyword + "'");
        }

        // Optional dimension tag (Z, M, ZM) or EMPTY
        cur.skipSpace();
        const std::string tag = cur.word();
        if (tag == "EMPTY") fail("polygon is empty");
        if (!tag.empty() && tag != "Z" && tag != "M" && tag != "ZM") {
            fail("unexpected token '" + tag + "' after POLYGON");
        }

        Polygon polygon;
        cur.expect('(');
        std::size_t ringIndex = 0;
        do {
            std::vector<PointXY> ring = parseRing(cur, ringIndex);
            if (ringIndex == 0) polygon.outer = std::move(ring);
            else polygon.holes.push_back(std::move(ring));
            ++ringIndex;
        } while (cur.accept(','));
        cur.expect(')');

        if (!cur.atEnd()) fail("trailing characters after polygon");
        return polygon;
    }

} // namespace suitgeo
