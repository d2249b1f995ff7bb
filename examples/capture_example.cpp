// SPDX-License-Identifier: MIT
//
// Live capture over an AF_PACKET RX ring.
//
// Usage: capture_example <interface> [1|2|3] [packet-count]
// Needs CAP_NET_RAW.

#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <linux/if_ether.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <poll.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <tpview.hpp>
#include <unistd.h>

using namespace tpview;

namespace {

std::system_error make_sys_error(const std::string& what) {
    return std::system_error(errno, std::generic_category(), what);
}

/**
 * Packet socket with a mapped RX ring
 *
 * Owns the descriptor and the mapping; RingRegion only borrows the mapping.
 */
class CaptureSocket {
public:
    CaptureSocket(const std::string& ifname, const RingGeometry& geometry)
        : geometry_(geometry) {
        fd_ = ::socket(AF_PACKET, SOCK_RAW, htons(ETH_P_ALL));
        if (fd_ < 0) {
            throw make_sys_error("socket(AF_PACKET)");
        }
        try {
            set_version();
            map_ring();
            bind_interface(ifname);
        } catch (...) {
            close();
            throw;
        }
    }

    CaptureSocket(const CaptureSocket&) = delete;
    CaptureSocket& operator=(const CaptureSocket&) = delete;

    ~CaptureSocket() { close(); }

    int fd() const noexcept { return fd_; }
    std::span<uint8_t> area() const noexcept { return {static_cast<uint8_t*>(map_), map_len_}; }

private:
    void set_version() {
        int version = static_cast<int>(geometry_.version);
        if (::setsockopt(fd_, SOL_PACKET, PACKET_VERSION, &version, sizeof(version)) < 0) {
            throw make_sys_error("setsockopt(PACKET_VERSION)");
        }
    }

    void map_ring() {
        int rc = 0;
        if (geometry_.version == TpacketVersion::v3) {
            tpacket_req3 req{};
            req.tp_block_size = static_cast<unsigned>(geometry_.block_size);
            req.tp_block_nr = static_cast<unsigned>(geometry_.block_count);
            req.tp_frame_size = static_cast<unsigned>(geometry_.frame_size);
            req.tp_frame_nr =
                static_cast<unsigned>(geometry_.block_size / geometry_.frame_size *
                                      geometry_.block_count);
            req.tp_retire_blk_tov = 60; // milliseconds
            req.tp_feature_req_word = TP_FT_REQ_FILL_RXHASH;
            rc = ::setsockopt(fd_, SOL_PACKET, PACKET_RX_RING, &req, sizeof(req));
        } else {
            tpacket_req req{};
            req.tp_block_size = static_cast<unsigned>(geometry_.block_size);
            req.tp_block_nr = static_cast<unsigned>(geometry_.block_count);
            req.tp_frame_size = static_cast<unsigned>(geometry_.frame_size);
            req.tp_frame_nr =
                static_cast<unsigned>(geometry_.block_size / geometry_.frame_size *
                                      geometry_.block_count);
            rc = ::setsockopt(fd_, SOL_PACKET, PACKET_RX_RING, &req, sizeof(req));
        }
        if (rc < 0) {
            throw make_sys_error("setsockopt(PACKET_RX_RING)");
        }

        size_t length = geometry_.block_size * geometry_.block_count;
        void* area = ::mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
        if (area == MAP_FAILED) {
            throw make_sys_error("mmap(PACKET_RX_RING)");
        }
        map_ = area;
        map_len_ = length;
    }

    void bind_interface(const std::string& ifname) {
        unsigned ifindex = ::if_nametoindex(ifname.c_str());
        if (ifindex == 0) {
            throw make_sys_error("if_nametoindex(" + ifname + ")");
        }
        sockaddr_ll sll{};
        sll.sll_family = AF_PACKET;
        sll.sll_protocol = htons(ETH_P_ALL);
        sll.sll_ifindex = static_cast<int>(ifindex);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&sll), sizeof(sll)) < 0) {
            throw make_sys_error("bind(AF_PACKET)");
        }
    }

    void close() noexcept {
        if (map_ != nullptr) {
            ::munmap(map_, map_len_);
            map_ = nullptr;
            map_len_ = 0;
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    RingGeometry geometry_;
    int fd_ = -1;
    void* map_ = nullptr;
    size_t map_len_ = 0;
};

void print_packet(const CaptureInfo& info, std::span<const uint8_t> bytes) {
    std::cout << info.timestamp.seconds() << "." << std::setfill('0') << std::setw(9)
              << info.timestamp.nanoseconds() << std::setfill(' ') << "  if=" << info.interface_index
              << "  len=" << info.capture_length << "/" << info.wire_length;
    if (info.vlan_id != no_vlan) {
        std::cout << "  vlan=" << info.vlan_id;
    }
    if (bytes.size() >= 14) {
        std::cout << "  ethertype=0x" << std::hex << std::setw(4) << std::setfill('0')
                  << ((bytes[12] << 8) | bytes[13]) << std::dec << std::setfill(' ');
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <interface> [1|2|3] [packet-count]\n";
        return 1;
    }
    std::string ifname = argv[1];
    int version_arg = argc > 2 ? std::atoi(argv[2]) : 3;
    long limit = argc > 3 ? std::atol(argv[3]) : 32;

    RingGeometry geometry;
    switch (version_arg) {
        case 1:
            geometry = {TpacketVersion::v1, 4096, 64, 2048};
            break;
        case 2:
            geometry = {TpacketVersion::v2, 4096, 64, 2048};
            break;
        case 3:
            geometry = {TpacketVersion::v3, 1 << 20, 8, 2048};
            break;
        default:
            std::cerr << "unknown TPACKET version " << version_arg << "\n";
            return 1;
    }

    try {
        CaptureSocket capture(ifname, geometry);
        RingRegion ring(capture.area(), geometry);
        CaptureOptions options{.add_vlan_header = true};

        std::cout << "Capturing on " << ifname << " with " << version_string(ring.version())
                  << " (" << ring.slot_count() << " slots of " << ring.slot_size()
                  << " bytes)\n";

        size_t index = 0;
        long seen = 0;
        while (seen < limit) {
            if (!ring.ready(index)) {
                pollfd pfd{};
                pfd.fd = capture.fd();
                pfd.events = POLLIN | POLLERR;
                if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) {
                    throw make_sys_error("poll");
                }
                continue;
            }

            auto hdr = ring.open(index);
            if (!hdr) {
                std::cerr << "slot " << index << ": " << hdr.error().message() << "\n";
                return 1;
            }
            if (hdr->has_packet()) {
                do {
                    PacketBytes bytes = hdr->payload(options);
                    print_packet(hdr->capture_info(), bytes);
                    ++seen;
                } while (hdr->advance());
            }
            if (const auto* block = std::get_if<V3BlockView>(&hdr->view());
                block != nullptr && block->error() != ValidationError::none) {
                std::cerr << "block " << block->sequence_number() << ": "
                          << validation_error_string(block->error()) << "\n";
            }
            std::move(*hdr).release();
            index = ring.next_index(index);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
