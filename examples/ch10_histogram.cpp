#include <iomanip>
#include <iostream>
#include <map>

#include <cstdint>
#include <ch10io.hpp>

using namespace ch10io;

// Packet count per data type across a whole recording
int main(int argc, char* argv[]) {
    std::cout << "IRIG 106 Packet Histogram\n";

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <filename>\n";
        return 1;
    }

    PacketStream<> stream;
    Status st = stream.open(argv[1], FileMode::read);
    if (st != Status::ok) {
        std::cerr << "Error opening data file '" << argv[1] << "': " << status_string(st)
                  << "\n";
        return 1;
    }

    std::map<uint8_t, size_t> counts;
    auto range = headers(stream);
    for (const auto& hdr : range) {
        ++counts[hdr.data_type()];
    }

    if (range.status() != Status::ok) {
        // The cursor stays on the packet that failed
        auto pos = stream.get_pos();
        std::cerr << "Stopped at offset " << (pos ? *pos : 0) << ": "
                  << status_string(range.status());
        if (stream.last_parse_error()) {
            std::cerr << " (" << stream.last_parse_error()->message() << ")";
        }
        std::cerr << "\n";
    }

    for (const auto& [type, count] : counts) {
        std::cout << "Data Type " << std::left << std::setw(24) << data_type_name(type)
                  << " Counts = " << count << "\n";
    }

    Status close_st = stream.close();
    if (range.status() != Status::ok) {
        return 2;
    }
    return close_st == Status::ok ? 0 : 1;
}
