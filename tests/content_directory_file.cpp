#include "chunknet/directory/ContentDirectoryFile.hpp"

#include "test_support.hpp"

#include <cassert>
#include <filesystem>

using namespace chunknet::directory;

int main() {
    chunknet::test::quiet_logs();
    chunknet::test::ScratchDir scratch("content_dict");
    const auto path = scratch / "content_dict.json";

    // Missing file behaves as an empty directory.
    const auto empty = load_content_directory(path);
    assert(empty.has_value());
    assert(empty->empty());

    chunknet::ContentDirectory directory;
    directory["movie_1.mp4"] = {"aa11", {"10.0.0.4", "10.0.0.5:5003"}};
    directory["movie_2.mp4"] = {"bb22", {"10.0.0.4"}};
    assert(save_content_directory(directory, path));
    assert(!std::filesystem::exists(path.string() + ".tmp"));

    const auto loaded = load_content_directory(path);
    assert(loaded.has_value());
    assert(*loaded == directory);

    // The on-disk form is a chunk -> {checksum, peers} object.
    const auto decoded = decode_content_directory(R"({"a_1.bin": {"checksum": "ff", "peers": ["1.2.3.4"]}})");
    assert(decoded.has_value());
    assert(decoded->at("a_1.bin").checksum == "ff");
    assert(decoded->at("a_1.bin").peers.size() == 1);

    assert(!decode_content_directory(R"({"a_1.bin": {"checksum": "ff"}})").has_value());
    assert(!decode_content_directory(R"({"a_1.bin": {"checksum": "ff", "peers": [1]}})").has_value());
    assert(!decode_content_directory("[]").has_value());

    chunknet::test::write_text(path, "{ truncated");
    assert(!load_content_directory(path).has_value());

    return 0;
}
