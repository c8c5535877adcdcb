#include "chunknet/directory/PeerDirectory.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using chunknet::PeerChunkMap;
using chunknet::directory::PeerDirectory;

using namespace std::chrono_literals;

int main() {
    chunknet::test::quiet_logs();

    // Applying the same announcement twice changes nothing the second time.
    {
        PeerDirectory directory(300s);
        const PeerChunkMap chunks{{"f_1.txt", "aa"}, {"f_2.txt", "bb"}};
        assert(directory.update_peer("10.0.0.4", chunks));
        assert(directory.take_modified());
        assert(!directory.update_peer("10.0.0.4", chunks));
        assert(!directory.merge_peer("10.0.0.4", chunks));
        assert(!directory.take_modified());

        const auto content = directory.content_directory();
        assert(content.size() == 2);
        assert(content.at("f_1.txt").checksum == "aa");
        assert((content.at("f_1.txt").peers == std::vector<std::string>{"10.0.0.4"}));

        // Full replacement drops chunks the peer no longer announces.
        assert(directory.update_peer("10.0.0.4", PeerChunkMap{{"f_2.txt", "bb"}}));
        assert(!directory.content_directory().contains("f_1.txt"));

        // Merge only adds.
        assert(directory.merge_peer("10.0.0.4", PeerChunkMap{{"f_3.txt", "cc"}}));
        assert(directory.content_directory().size() == 2);
    }

    // The projection is independent of the order announcements arrive in.
    {
        PeerDirectory first(300s);
        PeerDirectory second(300s);
        const PeerChunkMap a{{"f_1.txt", "aa"}, {"f_2.txt", "bb"}};
        const PeerChunkMap b{{"f_2.txt", "bb"}, {"f_3.txt", "cc"}};
        const PeerChunkMap c{{"f_1.txt", "aa"}};

        first.update_peer("10.0.0.5", a);
        first.update_peer("10.0.0.6", b);
        first.update_peer("10.0.0.7", c);

        second.update_peer("10.0.0.7", c);
        second.update_peer("10.0.0.6", b);
        second.update_peer("10.0.0.5", a);
        second.update_peer("10.0.0.6", b);

        const auto left = first.content_directory();
        const auto right = second.content_directory();
        assert(left == right);
        assert((left.at("f_1.txt").peers == std::vector<std::string>{"10.0.0.5", "10.0.0.7"}));
        assert((left.at("f_2.txt").peers == std::vector<std::string>{"10.0.0.5", "10.0.0.6"}));
    }

    // A peer advertising a different checksum for a known chunk is left out of that entry.
    {
        PeerDirectory directory(300s);
        directory.update_peer("10.0.0.5", PeerChunkMap{{"f_1.txt", "aa"}});
        directory.update_peer("10.0.0.6", PeerChunkMap{{"f_1.txt", "ff"}, {"f_2.txt", "bb"}});
        const auto content = directory.content_directory();
        assert(content.at("f_1.txt").checksum == "aa");
        assert((content.at("f_1.txt").peers == std::vector<std::string>{"10.0.0.5"}));
        assert((content.at("f_2.txt").peers == std::vector<std::string>{"10.0.0.6"}));
    }

    // Peers silent for longer than the timeout are pruned.
    {
        PeerDirectory directory(60s);
        directory.update_peer("10.0.0.5", PeerChunkMap{{"f_1.txt", "aa"}});
        directory.update_peer("10.0.0.6", PeerChunkMap{{"f_1.txt", "aa"}});
        directory.take_modified();

        assert(directory.remove_stale().empty());
        const auto removed = directory.remove_stale(PeerDirectory::Clock::now() + 61s);
        assert(removed.size() == 2);
        assert(directory.peer_count() == 0);
        assert(directory.take_modified());
        assert(directory.content_directory().empty());
    }

    // The reaper notifies its callback once peers go stale.
    {
        PeerDirectory directory(1s);
        directory.update_peer("10.0.0.5", PeerChunkMap{{"f_1.txt", "aa"}});
        std::vector<std::string> pruned;
        directory.start_reaper(100ms, [&pruned](const std::vector<std::string>& removed) {
            pruned.insert(pruned.end(), removed.begin(), removed.end());
        });
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (directory.peer_count() != 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(50ms);
        }
        directory.stop_reaper();
        assert(directory.peer_count() == 0);
        assert((pruned == std::vector<std::string>{"10.0.0.5"}));
    }

    // Seeding from a persisted directory restores per-peer maps.
    {
        PeerDirectory directory(300s);
        chunknet::ContentDirectory persisted;
        persisted["f_1.txt"] = {"aa", {"10.0.0.5", "10.0.0.6"}};
        persisted["f_2.txt"] = {"bb", {"10.0.0.6"}};
        directory.seed(persisted);
        assert(directory.peer_count() == 2);
        assert(directory.content_directory() == persisted);
    }

    return 0;
}
