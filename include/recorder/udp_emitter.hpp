#pragma once

#include "recorder/emitter.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace xrayot {

/**
 * @brief Sends segment documents to the X-Ray daemon over UDP
 *
 * Each datagram is the daemon header line followed by one JSON document:
 *   {"format": "json", "version": 1}\n{...segment...}
 * Send failures bump a counter and are logged; they never throw.
 */
class UdpEmitter : public IEmitter {
public:
    struct Config {
        std::string address = "127.0.0.1:2000";
    };

    static constexpr const char* kProtocolHeader = "{\"format\": \"json\", \"version\": 1}\n";

    explicit UdpEmitter(const Config& config);
    ~UdpEmitter() override;

    UdpEmitter(const UdpEmitter&) = delete;
    UdpEmitter& operator=(const UdpEmitter&) = delete;

    [[nodiscard]] bool send_segment(const Segment& segment) override;
    [[nodiscard]] bool send_subsegment(const Subsegment& subsegment) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] uint64_t send_failures() const { return send_failures_.load(); }
    [[nodiscard]] uint64_t documents_sent() const { return documents_sent_.load(); }

    /**
     * @brief Split "host:port"
     * @return false if the port is missing or outside 1..65535
     */
    [[nodiscard]] static bool parse_address(const std::string& address,
                                            std::string& host, uint16_t& port);

private:
    bool send_payload(const std::string& document);

    Config config_;
    std::string host_;
    uint16_t port_ = 2000;

    std::mutex socket_mutex_;
    int fd_ = -1;

    std::atomic<uint64_t> send_failures_{0};
    std::atomic<uint64_t> documents_sent_{0};
};

} // namespace xrayot
