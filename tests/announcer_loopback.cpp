#include "chunknet/network/Announcer.hpp"
#include "chunknet/network/Listener.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <thread>

using namespace chunknet;
using namespace std::chrono_literals;

int main() {
    test::quiet_logs();
    test::ScratchDir scratch("announcer");

    assert(network::Announcer::subnet_broadcast_address("192.168.1.37") == "192.168.1.255");
    assert(network::Announcer::subnet_broadcast_address("127.0.0.1") == "255.255.255.255");

    const auto chunk_dir = scratch / "chunks";
    storage::ChunkStore store(chunk_dir);
    assert(store.ensure_directory());

    directory::PeerDirectory directory(300s);
    network::Listener::Options listener_options{};
    listener_options.host = "127.0.0.1";
    listener_options.port = 0;
    listener_options.content_dict_path = scratch / "content_dict.json";
    listener_options.poll_interval = 50ms;
    network::Listener listener(directory, listener_options);
    listener.start();

    network::Announcer::Options options{};
    options.target_ports = {listener.port()};
    options.delivery = {network::Announcer::Delivery::Loopback};
    options.advertised_ip = "127.0.0.1";
    options.peer_port = std::uint16_t{5007};
    options.batch_size = 4;
    network::Announcer announcer(store, options);

    // Nothing to announce yet.
    assert(announcer.announce_once() == 0);

    const auto payload = test::make_payload(2048, 9);
    for (int i = 1; i <= 10; ++i) {
        test::write_file(chunk_dir / ("clip_" + std::to_string(i) + ".bin"), payload);
    }
    // Hidden temp files are never announced.
    test::write_file(chunk_dir / ".clip_11.bin.0.tmp", payload);

    assert(announcer.announce_once() == 3);

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (directory.content_directory().size() < 10 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    listener.stop();

    const auto content = directory.content_directory();
    assert(content.size() == 10);
    for (const auto& [chunk, entry] : content) {
        assert(entry.checksum == test::checksum_of(payload));
        assert((entry.peers == std::vector<std::string>{"127.0.0.1:5007"}));
    }

    return 0;
}
