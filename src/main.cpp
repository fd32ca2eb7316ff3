#include <iostream>
#include <string>

#include "API/headers/GridPainter.h"
#include "Debug/headers/LogBufferManager.h"

namespace {
    constexpr int EXIT_USAGE = 1;
    constexpr int EXIT_CONVERSION_FAILED = 2;

    void printUsage(const char* program) {
        std::cout << "GridPainter " << GridPainter::GetLibraryVersion() << "\n"
                  << "Renders an image as a sheet of colored cells, one cell per pixel.\n\n"
                  << "Usage: " << program << " <image-path>\n"
                  << "  <image-path>  BMP (24/32-bit, uncompressed) or binary PPM (P6) image\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argc > 0 ? argv[0] : "gridpainter");
        return EXIT_USAGE;
    }

    const bool converted = GridPainter::ImageToGrid(argv[1]);

    debug::LogBufferManager::getInstance().shutdown();

    return converted ? 0 : EXIT_CONVERSION_FAILED;
}
