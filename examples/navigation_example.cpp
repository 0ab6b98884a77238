#include <iomanip>
#include <iostream>

#include <cstdlib>
#include <ch10io.hpp>

using namespace ch10io;

// Print one line per header with its offset
void printHeader(uint64_t offset, const PacketHeader& hdr) {
    std::cout << "  @" << std::setw(10) << offset << "  ch " << std::setw(5) << hdr.channel_id()
              << "  seq " << std::setw(3) << static_cast<int>(hdr.sequence_number()) << "  len "
              << std::setw(8) << hdr.packet_length() << "  " << hdr.data_type_name()
              << (hdr.has_secondary_header() ? "  [secondary]" : "") << "\n";
}

int main(int argc, char* argv[]) {
    std::cout << "ch10io Navigation Examples\n";
    std::cout << "==========================\n\n";

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <filename> [count]\n";
        return 1;
    }
    int count = argc > 2 ? std::atoi(argv[2]) : 5;

    PacketStream<> stream;
    if (Status st = stream.open(argv[1], FileMode::read); st != Status::ok) {
        std::cerr << "open failed: " << status_string(st) << "\n";
        return 1;
    }
    std::cout << "File size: " << stream.size() << " bytes\n\n";

    // Example 1: Forward from the start
    std::cout << "1. First " << count << " packets\n";
    std::cout << "-----------------\n";
    for (int i = 0; i < count; ++i) {
        Status st = stream.read_next_header();
        if (st == Status::format_error) {
            std::cout << "  format error at offset " << stream.get_pos().value_or(0)
                      << ", resyncing\n";
            if (resync_forward(stream) != Status::ok) {
                break;
            }
            continue;
        }
        if (st != Status::ok) {
            std::cout << "  " << status_string(st) << "\n";
            break;
        }
        printHeader(stream.header_offset(), *stream.header());
    }
    std::cout << std::endl;

    // Example 2: Backward from the end
    std::cout << "2. Last " << count << " packets, newest first\n";
    std::cout << "-----------------------------\n";
    if (Status st = stream.last(); st != Status::ok) {
        std::cout << "  last(): " << status_string(st) << "\n";
    } else if (stream.read_next_header() == Status::ok) {
        printHeader(stream.header_offset(), *stream.header());
        for (int i = 1; i < count; ++i) {
            Status prev = stream.read_prev_header();
            if (prev != Status::ok) {
                std::cout << "  " << status_string(prev) << "\n";
                break;
            }
            printHeader(stream.header_offset(), *stream.header());
        }
    }
    std::cout << std::endl;

    // Example 3: Reposition with get_pos / set_pos
    std::cout << "3. Bookmarks\n";
    std::cout << "------------\n";
    if (Status st = stream.first(); st != Status::ok) {
        std::cout << "  first(): " << status_string(st) << "\n";
        return 0;
    }
    if (Status st = stream.read_next_header(); st != Status::ok) {
        std::cout << "  " << status_string(st) << "\n";
        return 0;
    }
    auto bookmark = stream.get_pos();
    if (!bookmark) {
        std::cout << "  get_pos(): " << status_string(bookmark.error()) << "\n";
        return 0;
    }
    if (Status st = stream.read_next_header(); st != Status::ok) {
        std::cout << "  no packet after bookmark: " << status_string(st) << "\n";
        return 0;
    }
    std::cout << "  Skipped past bookmark to:\n";
    printHeader(stream.header_offset(), *stream.header());
    if (stream.set_pos(*bookmark) == Status::ok && stream.read_next_header() == Status::ok) {
        std::cout << "  Returned to bookmark " << *bookmark << ":\n";
        printHeader(stream.header_offset(), *stream.header());
    }

    return 0;
}
