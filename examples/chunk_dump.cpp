/**
 * @file chunk_dump.cpp
 * @brief List the master header and chunks of an IFF/RIFF/RF64/Wave64 file
 *
 * Reads the file named on the command line, or standard input when no file
 * is given, and prints one line per chunk.
 */

#include <raff/parser.hh>
#include <raff/exceptions.hh>
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

static void usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [file]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --ignore ID      Skip chunks with this identifier (repeatable)\n";
    std::cout << "  --show-payload   Print the first bytes of each payload in hex\n";
    std::cout << "  --descend        Enter LIST/FORM/CAT/PROP groups\n";
    std::cout << "  --lenient        Recover from malformed sizes where possible\n";
    std::cout << "\n";
    std::cout << "Without a file, data is read from standard input.\n";
}

static void print_preview(const std::vector<std::byte>& payload, int indent) {
    constexpr std::size_t preview_size = 16;
    std::cout << std::string(static_cast<std::size_t>(indent), ' ') << "  payload:";

    auto flags = std::cout.flags();
    for (std::size_t i = 0; i < std::min(payload.size(), preview_size); i++) {
        std::cout << ' ' << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<unsigned>(payload[i]);
    }
    std::cout.flags(flags);
    std::cout << std::setfill(' ');

    if (payload.size() > preview_size) {
        std::cout << " ...";
    }
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    raff::scan_options options;
    const char* path = nullptr;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--ignore") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: --ignore needs an identifier\n";
                return 1;
            }
            options.ignore.insert(raff::fourcc(argv[++i]));
        } else if (std::strcmp(argv[i], "--show-payload") == 0) {
            options.materialize_payload = true;
        } else if (std::strcmp(argv[i], "--descend") == 0) {
            options.descend_containers = true;
        } else if (std::strcmp(argv[i], "--lenient") == 0) {
            options.strict = false;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Error: Unknown option '" << argv[i] << "'\n";
            usage(argv[0]);
            return 1;
        } else if (!path) {
            path = argv[i];
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        auto source = path ? raff::byte_source::open(path) : raff::byte_source::from_stream(std::cin);
        auto scanner = raff::chunk_scanner::create(*source, options);

        const auto& master = scanner->master();
        std::cout << "Master: " << master.id << " type " << master.type
                  << " size " << master.size
                  << " (" << raff::to_string(master.variant) << ", "
                  << raff::to_string(scanner->order()) << "-endian)\n";
        if (master.rf64) {
            std::cout << "  ds64: data size " << master.rf64->data_size
                      << ", samples " << master.rf64->sample_count << "\n";
        }

        std::size_t count = 0;
        while (auto chunk = scanner->next()) {
            const int indent = chunk->depth * 2;
            std::cout << std::string(static_cast<std::size_t>(indent), ' ')
                      << chunk->id << " size " << chunk->size << " at offset " << chunk->offset;
            if (chunk->type) {
                std::cout << " type " << *chunk->type;
            }
            if (chunk->uuid) {
                std::cout << " " << *chunk->uuid;
            }
            std::cout << "\n";

            if (chunk->payload) {
                print_preview(*chunk->payload, indent);
            }
            count++;
        }

        std::cout << count << " chunk(s)\n";
    } catch (const raff::unrecognized_format_error& e) {
        std::cerr << "Unrecognized format: " << e.what() << "\n";
        return 2;
    } catch (const raff::truncated_error& e) {
        std::cerr << "Truncated at offset " << e.offset() << ": " << e.what() << "\n";
        return 3;
    } catch (const raff::raff_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
