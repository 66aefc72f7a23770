#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>
#include <curl/curl.h>

#include "cli.hpp"

int main(int argc, char* argv[])
{
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exitCode = NetcapSetup::Cli::run(
        std::vector<std::string>(argv + 1, argv + argc), geteuid(), std::cout);

    curl_global_cleanup();
    return exitCode;
}
