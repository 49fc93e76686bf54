#include <catch2/catch_test_macros.hpp>
#include "peerdrop/transfer/file_metadata_codec.hpp"
#include <string>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::transfer;

TEST_CASE("FileMetadataCodec - Encoding", "[metadata][transfer]") {
    const auto metadata = FileMetadataCodec::Make("report.pdf", 5242880, "application/pdf", "ab12");
    auto json = FileMetadataCodec::Encode(metadata);
    REQUIRE(json.IsOk());
    const std::string& text = json.Unwrap();
    REQUIRE(text.find(R"("type":"fileMetadata")") != std::string::npos);
    REQUIRE(text.find(R"("fileName":"report.pdf")") != std::string::npos);
    REQUIRE(text.find(R"("fileType":"application/pdf")") != std::string::npos);
    REQUIRE(text.find(R"("fileHash":"ab12")") != std::string::npos);
    REQUIRE(text.find(R"("fileSize":5242880)") != std::string::npos);
    REQUIRE(text.find(R"("fileSize":")") == std::string::npos);

    auto decoded = FileMetadataCodec::TryDecode(text);
    REQUIRE(decoded.has_value());
    REQUIRE(FileMetadataCodec::FileSize(*decoded) == 5242880);

    SECTION("Ten megabytes stays a plain integer") {
        auto large = FileMetadataCodec::Encode(FileMetadataCodec::Make("big.bin", 10000000, "", "00"));
        REQUIRE(large.IsOk());
        REQUIRE(large.Unwrap().find(R"("fileSize":10000000)") != std::string::npos);
    }
    SECTION("Empty file") {
        auto empty = FileMetadataCodec::Encode(FileMetadataCodec::Make("empty", 0, "", "00"));
        REQUIRE(empty.IsOk());
        REQUIRE(empty.Unwrap().find(R"("fileSize":0)") != std::string::npos);
    }
}

TEST_CASE("FileMetadataCodec - Decoding", "[metadata][transfer]") {
    SECTION("Numeric fileSize is accepted") {
        auto decoded = FileMetadataCodec::TryDecode(
            R"({"type":"fileMetadata","fileName":"a.txt","fileSize":12,"fileType":"text/plain","fileHash":"00"})");
        REQUIRE(decoded.has_value());
        REQUIRE(FileMetadataCodec::FileSize(*decoded) == 12);
        REQUIRE(decoded->file_name() == "a.txt");
    }
    SECTION("Unknown fields are ignored") {
        auto decoded = FileMetadataCodec::TryDecode(
            R"({"type":"fileMetadata","fileName":"a","fileSize":"1","fileHash":"00","extra":true})");
        REQUIRE(decoded.has_value());
    }
    SECTION("Quoted fileSize is accepted") {
        auto decoded = FileMetadataCodec::TryDecode(
            R"({"type":"fileMetadata","fileName":"a","fileSize":"4096","fileHash":"00"})");
        REQUIRE(decoded.has_value());
        REQUIRE(FileMetadataCodec::FileSize(*decoded) == 4096);
    }
    SECTION("Fractional, negative or oversized fileSize is rejected") {
        REQUIRE_FALSE(FileMetadataCodec::TryDecode(
            R"({"type":"fileMetadata","fileName":"a","fileSize":12.5,"fileHash":"00"})").has_value());
        REQUIRE_FALSE(FileMetadataCodec::TryDecode(
            R"({"type":"fileMetadata","fileName":"a","fileSize":-1,"fileHash":"00"})").has_value());
        REQUIRE_FALSE(FileMetadataCodec::TryDecode(
            R"({"type":"fileMetadata","fileName":"a","fileSize":1e300,"fileHash":"00"})").has_value());
    }
    SECTION("Other message types are not metadata") {
        REQUIRE_FALSE(FileMetadataCodec::TryDecode(R"({"type":"chat","text":"hi"})").has_value());
    }
    SECTION("Non-JSON text is not metadata") {
        REQUIRE_FALSE(FileMetadataCodec::TryDecode("hello there").has_value());
    }
}
