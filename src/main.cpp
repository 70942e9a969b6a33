#include "blobfetch/detail/curl_utils.hpp"
#include "blobfetch/errors.hpp"
#include "blobfetch/http_remote_object.hpp"
#include "blobfetch/logging.hpp"
#include "blobfetch/options.hpp"
#include "blobfetch/resumable_downloader.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char** argv) {
    try {
        const std::vector<std::string> args(argv + 1, argv + argc);

        blobfetch::CommandLine command_line;
        try {
            command_line = blobfetch::parseArguments(args);
        } catch (const blobfetch::ConfigurationError& ex) {
            std::cerr << ex.what() << std::endl;
            blobfetch::printUsage(argv[0]);
            return 1;
        }

        if (command_line.show_help) {
            blobfetch::printUsage(argv[0]);
            return 0;
        }

        blobfetch::initLogging(command_line.verbose);
        blobfetch::detail::ensureCurlInitialized();

        auto options = std::move(command_line.options);
        const auto requested = options.destination;
        options.destination = blobfetch::resolveDestination(options.url, requested);
        if (options.destination != requested) {
            std::cout << "Info: Saving to '" << options.destination.string() << "'" << std::endl;
        }

        auto remote = std::make_shared<blobfetch::HttpRemoteObject>(options.url, options.bearer_token);
        blobfetch::ResumableDownloader downloader{std::move(options), std::move(remote), std::cout};
        downloader.run();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
