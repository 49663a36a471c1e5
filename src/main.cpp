#include "streamdl/console.hpp"
#include "streamdl/curl_transport.hpp"
#include "streamdl/format.hpp"
#include "streamdl/options.hpp"
#include "streamdl/output_sink.hpp"
#include "streamdl/streaming_downloader.hpp"

#include <chrono>
#include <climits>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url> <output>" << std::endl;
    std::cerr << "Options:\n"
              << "  -v, --verbose          Print redirect hops and transfer statistics\n"
              << "  -q, --quiet            Do not draw the progress bar\n"
              << "  --max-redirects <n>    Give up after n redirects (default: unlimited)\n"
              << "  --connect-timeout <s>  Connection timeout in seconds (default: 30)\n"
              << "  --idle-timeout <s>     Abort when no data arrives for s seconds, 0 disables (default: 60)\n"
              << "  --insecure             Skip TLS certificate verification\n"
              << "  -h, --help             Show this message" << std::endl;
}
} // namespace

int main(int argc, char** argv) {
    try {
        bool verbose = false;
        streamdl::DownloaderOptions options;
        streamdl::CurlTransportOptions transport_options;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-v" || option == "--verbose") {
                verbose = true;
                arg_index += 1;
            } else if (option == "-q" || option == "--quiet") {
                options.show_progress = false;
                arg_index += 1;
            } else if (option == "--insecure") {
                transport_options.verify_tls = false;
                arg_index += 1;
            } else if (option == "--max-redirects" || option == "--connect-timeout" || option == "--idle-timeout") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                const std::string value = argv[arg_index + 1];
                if (option == "--max-redirects") {
                    options.max_redirects = static_cast<unsigned>(
                        streamdl::parseOptionValue(option, value, std::numeric_limits<unsigned>::max()));
                } else {
                    // libcurl takes timeouts as long seconds.
                    const auto seconds = std::chrono::seconds{
                        static_cast<long>(streamdl::parseOptionValue(option, value, LONG_MAX))};
                    if (option == "--connect-timeout") {
                        transport_options.connect_timeout = seconds;
                    } else {
                        transport_options.idle_timeout = seconds;
                    }
                }
                arg_index += 2;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (argc - arg_index != 2) {
            printUsage(argv[0]);
            return 1;
        }

        const std::string url = argv[arg_index];
        const std::string destination = argv[arg_index + 1];

        streamdl::Console console(std::cout, std::cerr, verbose);
        if (verbose) {
            console.header(fmt::format("Downloading {}", url));
        }

        streamdl::FileSink sink(destination);
        streamdl::StreamingDownloader downloader(
            std::make_shared<streamdl::CurlTransport>(transport_options), console, options);

        try {
            const auto summary = downloader.download(url, sink);
            console.info(fmt::format("Saved {} to {}",
                                     streamdl::formatSize(static_cast<double>(summary.bytes_received)),
                                     streamdl::color::green(destination)));
        } catch (const streamdl::DownloadError& ex) {
            console.error(fmt::format("Download failed ({}): {}", streamdl::toString(ex.kind()), ex.what()));
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
