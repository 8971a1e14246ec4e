/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic pngme usage
 *
 * This is a minimal example showing how to walk the chunks of a PNG file
 * and print information about them.
 */

#include <pngme/parser.hh>
#include <iostream>
#include <fstream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    // Open the file
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    // Report problems instead of stopping at the first one
    pngme::parse_options options;
    options.strict = false;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning (" << category << ") at " << offset << ": " << message << "\n";
    };

    try {
        pngme::for_each_chunk(file, [](const auto& info) {
            const auto& type = info.chunk.type();
            std::cout << "Chunk: " << type
                      << " (" << info.chunk.length() << " bytes at offset " << info.file_offset << ")\n";

            if (!type.is_critical() && !type.is_public()) {
                std::cout << "  Private ancillary chunk: " << info.chunk << "\n";
            }
        }, options);

        std::cout << "\nParsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
