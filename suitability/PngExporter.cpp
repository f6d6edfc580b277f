// File: PngExporter.cpp
#include "PngExporter.hpp"

#include <png.h>
#include <cstdio>
#include <vector>

namespace suitgeo {

    namespace {

        // Releases the libpng structures and the file on every exit path
        struct PngWriteGuard {
            FILE* fp = nullptr;
            png_structp png = nullptr;
            png_infop info = nullptr;

            ~PngWriteGuard() {
                if (png) png_destroy_write_struct(&png, info ? &info : nullptr);
                if (fp) std::fclose(fp);
            }
        };

    } // anonymous namespace

    void writePng(const Raster& grid, const std::string& filePath) {
        if (!grid.isValid()) {
            throw OverlayError(ErrorKind::ExportFailed, "cannot write invalid raster to '" + filePath + "'");
        }

        const std::size_t width = grid.width();
        const std::size_t height = grid.height();

        // Interleaved grey/alpha rows, prepared before libpng takes over
        std::vector<png_byte> pixels(width * height * 2);
        for (std::size_t y = 0; y < height; ++y) {
            for (std::size_t x = 0; x < width; ++x) {
                const GridCellData& cell = grid.at(x, y);
                png_byte* px = &pixels[(y * width + x) * 2];
                if (cell.isNodata()) {
                    px[0] = 0;
                    px[1] = 0;
                    continue;
                }
                float v = std::max(static_cast<float>(BYTE_MIN), std::min(static_cast<float>(BYTE_MAX), cell.value));
                px[0] = static_cast<png_byte>(v);
                px[1] = 255;
            }
        }
        std::vector<png_bytep> rows(height);
        for (std::size_t y = 0; y < height; ++y) rows[y] = &pixels[y * width * 2];

        PngWriteGuard guard;
        guard.fp = std::fopen(filePath.c_str(), "wb");
        if (!guard.fp) {
            throw OverlayError(ErrorKind::ExportFailed, "cannot open '" + filePath + "' for writing");
        }
        guard.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!guard.png) {
            throw OverlayError(ErrorKind::ExportFailed, "png_create_write_struct failed for '" + filePath + "'");
        }
        guard.info = png_create_info_struct(guard.png);
        if (!guard.info) {
            throw OverlayError(ErrorKind::ExportFailed, "png_create_info_struct failed for '" + filePath + "'");
        }

        if (setjmp(png_jmpbuf(guard.png))) {
            throw OverlayError(ErrorKind::ExportFailed, "libpng error while writing '" + filePath + "'");
        }

        png_init_io(guard.png, guard.fp);
        png_set_IHDR(guard.png, guard.info,
            static_cast<png_uint_32>(width), static_cast<png_uint_32>(height),
            8, PNG_COLOR_TYPE_GRAY_ALPHA, PNG_INTERLACE_NONE,
            PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
        png_set_compression_level(guard.png, 6);
        png_write_info(guard.png, guard.info);
        png_write_image(guard.png, rows.data());
        png_write_end(guard.png, guard.info);

        FILE* fp = guard.fp;
        guard.fp = nullptr;
        if (std::fclose(fp) != 0) {
            throw OverlayError(ErrorKind::ExportFailed, "failed to flush '" + filePath + "'");
        }
    }

} // namespace suitgeo
