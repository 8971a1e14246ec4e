//
// Created by igor on 17/08/2025.
//

#include <pngme/commands.hh>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <pngme/png.hh>
#include <pngme/pngme_config.h>
#include <algorithm>
#include <exception>
#include <iomanip>
#include <map>
#include <ostream>
#include <vector>

namespace pngme {
    namespace commands {

        namespace {
            std::vector<std::byte> to_bytes(const std::string& s) {
                std::vector<std::byte> out(s.size());
                std::transform(s.begin(), s.end(), out.begin(), [](char c) {
                    return static_cast<std::byte>(c);
                });
                return out;
            }

            void print_flags(std::ostream& out, const chunk_type& t) {
                out << (t.is_critical() ? "critical" : "ancillary") << ", "
                    << (t.is_public() ? "public" : "private") << ", "
                    << (t.is_safe_to_copy() ? "safe to copy" : "unsafe to copy");
                if (!t.is_reserved_bit_valid()) {
                    out << ", reserved bit set";
                }
            }

            void usage(std::ostream& os, const std::string& prog) {
                os << "pngme " << PNGME_VERSION << "\n"
                   << "Usage:\n"
                   << "  " << prog << " [--lenient] encode <file> <chunk_type> <message> [output_file]\n"
                   << "  " << prog << " [--lenient] decode <file> <chunk_type>\n"
                   << "  " << prog << " [--lenient] remove <file> <chunk_type>\n"
                   << "  " << prog << " [--lenient] print <file>\n";
            }
        }

        void encode(const encode_args& args, const parse_options& options, std::ostream& out) {
            // Reject a bad type before touching the file
            chunk_type type(args.chunk_type);

            auto image = png::from_file(args.file, options);
            chunk message(type, to_bytes(args.message));
            const auto length = message.length();
            image.append_chunk(std::move(message));

            const auto& target = args.output ? *args.output : args.file;
            image.write_file(target);

            out << "Encoded " << length << " bytes into chunk " << type
                << " of " << target.string() << "\n";
        }

        void decode(const decode_args& args, const parse_options& options, std::ostream& out) {
            const auto image = png::from_file(args.file, options);
            const chunk* found = image.chunk_by_type(args.chunk_type);
            THROW_PNG_UNLESS(found, "No chunk of type ", args.chunk_type, " in ", args.file.string());
            out << found->data_as_string() << "\n";
        }

        void remove(const remove_args& args, const parse_options& options, std::ostream& out) {
            auto image = png::from_file(args.file, options);
            const chunk removed = image.remove_first_chunk(args.chunk_type);
            image.write_file(args.file);

            out << "Removed chunk " << removed.type() << " (" << removed.length() << " bytes): "
                << removed << "\n";
        }

        void print(const print_args& args, const parse_options& options, std::ostream& out) {
            const auto image = png::from_file(args.file, options);
            const auto& chunks = image.chunks();

            out << args.file.string() << ": " << chunks.size() << " chunk(s)\n";

            std::map<chunk_type, std::size_t> by_type;
            for (std::size_t i = 0; i < chunks.size(); i++) {
                const auto& c = chunks[i];
                by_type[c.type()]++;

                auto flags = out.flags();
                auto fill = out.fill();
                out << std::setw(4) << i << "  " << c.type()
                    << std::setw(11) << c.length() << " bytes  crc 0x"
                    << std::hex << std::setfill('0') << std::setw(8) << c.crc();
                out.flags(flags);
                out.fill(fill);
                out << "  ";
                print_flags(out, c.type());
                out << "\n";
            }

            out << "\nChunks by type:\n";
            for (const auto& [type, count] : by_type) {
                out << "  " << type << ": " << count << "\n";
            }
        }

        int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
            const std::string prog = argc > 0 ? argv[0] : "pngme";
            std::vector<std::string> args;
            for (int i = 1; i < argc; i++) {
                args.emplace_back(argv[i]);
            }

            parse_options options;
            options.on_warning = [&err](std::uint64_t offset, std::string_view category, std::string_view message) {
                err << "warning: [" << category << "] " << message << " (offset " << offset << ")\n";
            };

            std::size_t pos = 0;
            if (pos < args.size() && args[pos] == "--lenient") {
                options.strict = false;
                pos++;
            }

            if (pos >= args.size()) {
                usage(err, prog);
                return 2;
            }

            const std::string command = args[pos++];
            const std::size_t n = args.size() - pos;
            const std::string* a = args.data() + pos;

            try {
                if (command == "encode" && (n == 3 || n == 4)) {
                    encode_args ea{a[0], a[1], a[2], std::nullopt};
                    if (n == 4) {
                        ea.output = std::filesystem::path(a[3]);
                    }
                    commands::encode(ea, options, out);
                } else if (command == "decode" && n == 2) {
                    commands::decode(decode_args{a[0], a[1]}, options, out);
                } else if (command == "remove" && n == 2) {
                    commands::remove(remove_args{a[0], a[1]}, options, out);
                } else if (command == "print" && n == 1) {
                    commands::print(print_args{a[0]}, options, out);
                } else if (command == "help" || command == "--help" || command == "-h") {
                    usage(out, prog);
                } else {
                    usage(err, prog);
                    return 2;
                }
            } catch (const pngme_error& e) {
                err << "Error: " << e.what() << "\n";
                return 1;
            } catch (const std::exception& e) {
                err << "Error: " << e.what() << "\n";
                return 1;
            }

            return 0;
        }

    } // namespace commands
} // namespace pngme
