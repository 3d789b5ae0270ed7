#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "../src/logsketch/ErrorCode.hpp"
#include "../src/logsketch/workflow/IpAddressExtractor.hpp"

using logsketch::workflow::IpAddressExtractor;

TEST_CASE("IpAddressExtractor finds the first address on a line", "[IpAddressExtractor]") {
    IpAddressExtractor const extractor;

    REQUIRE(extractor.extract("192.168.1.10 - - [10/Oct/2023:13:55:36] \"GET / HTTP/1.1\" 200")
            == "192.168.1.10");
    REQUIRE(extractor.extract("client=10.0.0.7 forwarded=172.16.0.1") == "10.0.0.7");
    REQUIRE(extractor.extract("no address here") == std::nullopt);
    REQUIRE(extractor.extract("1.2.3") == std::nullopt);
    REQUIRE(extractor.extract("") == std::nullopt);
}

TEST_CASE("IpAddressExtractor reads a log file", "[IpAddressExtractor]") {
    auto const path = std::filesystem::temp_directory_path() / "logsketch-test-access.log";
    {
        std::ofstream file(path);
        file << "10.1.1.1 GET /index.html\n"
             << "malformed line\n"
             << "\n"
             << "10.1.1.2 POST /login\n"
             << "10.1.1.1 GET /favicon.ico\n";
    }

    IpAddressExtractor const extractor;
    auto const addresses = extractor.load_from_file(path.string());
    std::filesystem::remove(path);

    std::vector<std::string> const expected{"10.1.1.1", "10.1.1.2", "10.1.1.1"};
    REQUIRE(addresses == expected);
}

TEST_CASE("IpAddressExtractor reports a missing file", "[IpAddressExtractor]") {
    IpAddressExtractor const extractor;
    auto const path = std::filesystem::temp_directory_path() / "logsketch-test-missing.log";
    std::filesystem::remove(path);

    try {
        static_cast<void>(extractor.load_from_file(path.string()));
        FAIL("expected OperationFailed");
    } catch (IpAddressExtractor::OperationFailed const& e) {
        REQUIRE(e.get_error_code() == logsketch::ErrorCodeFileNotFound);
    }
}
