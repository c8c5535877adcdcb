#include "chunknet/crypto/Sha256.hpp"

#include "test_support.hpp"

#include <cassert>
#include <string>
#include <string_view>
#include <vector>

using chunknet::crypto::Sha256;

namespace {

std::string digest_of(std::string_view text) {
    Sha256 hasher;
    hasher.update(text.data(), text.size());
    return hasher.finalize_hex();
}

}  // namespace

int main() {
    assert(digest_of("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(digest_of("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(digest_of("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
           "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

    // Incremental updates across block boundaries match a one-shot digest.
    const auto payload = chunknet::test::make_payload(200 * 1024 + 17, 7);
    Sha256 incremental;
    std::size_t offset = 0;
    std::size_t step = 1;
    while (offset < payload.size()) {
        const auto take = std::min(step, payload.size() - offset);
        incremental.update(std::span<const std::uint8_t>(payload.data() + offset, take));
        offset += take;
        step = step * 3 + 1;
    }
    const auto one_shot = Sha256::hex_digest(payload);
    assert(incremental.finalize_hex() == one_shot);

    // A single flipped bit changes the checksum.
    auto corrupted = payload;
    corrupted[corrupted.size() / 2] ^= 0x01;
    assert(Sha256::hex_digest(corrupted) != one_shot);

    chunknet::test::ScratchDir scratch("sha256");
    const auto file = scratch / "blob.bin";
    chunknet::test::write_file(file, payload);
    const auto from_file = Sha256::file_hex_digest(file);
    assert(from_file.has_value());
    assert(*from_file == one_shot);
    assert(!Sha256::file_hex_digest(scratch / "missing.bin").has_value());

    return 0;
}
