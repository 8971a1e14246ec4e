/**
 * @file commands.hh
 * @brief Hide and recover messages in PNG files
 * @author Igor
 * @date 17/08/2025
 *
 * Each command reads a PNG file, works on its chunk list and reports to
 * an output stream. Failures surface as pngme exceptions; run() turns
 * them into an exit status for the command line tool.
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <pngme/export_pngme.h>
#include <pngme/parse_options.hh>

namespace pngme {
    namespace commands {

        struct encode_args {
            std::filesystem::path file;
            std::string chunk_type;
            std::string message;
            std::optional<std::filesystem::path> output;  ///< Defaults to file
        };

        struct decode_args {
            std::filesystem::path file;
            std::string chunk_type;
        };

        struct remove_args {
            std::filesystem::path file;
            std::string chunk_type;
        };

        struct print_args {
            std::filesystem::path file;
        };

        /**
         * @brief Store message in a new chunk of the given type
         *
         * The chunk goes in front of IEND and the result is written to
         * args.output, or back to args.file.
         */
        PNGME_EXPORT void encode(const encode_args& args, const parse_options& options, std::ostream& out);

        /**
         * @brief Print the text of the first chunk of the given type
         * @throws png_error if there is no such chunk
         * @throws chunk_error if its data is not valid UTF-8
         */
        PNGME_EXPORT void decode(const decode_args& args, const parse_options& options, std::ostream& out);

        /**
         * @brief Delete the first chunk of the given type and rewrite the file
         */
        PNGME_EXPORT void remove(const remove_args& args, const parse_options& options, std::ostream& out);

        /**
         * @brief List every chunk with its properties
         */
        PNGME_EXPORT void print(const print_args& args, const parse_options& options, std::ostream& out);

        /**
         * @brief Command line entry point
         *
         *     pngme [--lenient] encode <file> <chunk_type> <message> [output_file]
         *     pngme [--lenient] decode <file> <chunk_type>
         *     pngme [--lenient] remove <file> <chunk_type>
         *     pngme [--lenient] print <file>
         *
         * @return 0 on success, 1 on error, 2 on bad usage
         */
        PNGME_EXPORT int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

    } // namespace commands
} // namespace pngme
