#include "recorder/udp_emitter.hpp"
#include "entity/entity.hpp"
#include "core/utils.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>

namespace xrayot {

UdpEmitter::UdpEmitter(const Config& config)
    : config_(config) {
    if (!parse_address(config_.address, host_, port_)) {
        utils::log::warn(std::format("UDP emitter: invalid daemon address '{}', using 127.0.0.1:2000",
                                     config_.address));
        host_ = "127.0.0.1";
        port_ = 2000;
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        utils::log::error(std::format("UDP emitter: socket() failed: {}", std::strerror(errno)));
    }
}

UdpEmitter::~UdpEmitter() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool UdpEmitter::parse_address(const std::string& address, std::string& host, uint16_t& port) {
    const auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) {
        return false;
    }

    unsigned int value = 0;
    const char* begin = address.data() + colon + 1;
    const char* end = address.data() + address.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || value == 0 || value > 65535) {
        return false;
    }

    host = address.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

bool UdpEmitter::send_segment(const Segment& segment) {
    return send_payload(segment.to_json().dump());
}

bool UdpEmitter::send_subsegment(const Subsegment& subsegment) {
    return send_payload(subsegment.to_document().dump());
}

std::string UdpEmitter::name() const {
    return std::format("udp:{}:{}", host_, port_);
}

bool UdpEmitter::send_payload(const std::string& document) {
    const std::string payload = kProtocolHeader + document;

    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (fd_ < 0) {
        send_failures_.fetch_add(1);
        return false;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* resolved = nullptr;
    const std::string port_str = std::to_string(port_);
    const int rc = ::getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &resolved);
    if (rc != 0 || !resolved) {
        send_failures_.fetch_add(1);
        utils::log::error(std::format("UDP emitter: cannot resolve {}: {}", host_, ::gai_strerror(rc)));
        return false;
    }

    const ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                                  resolved->ai_addr, resolved->ai_addrlen);
    ::freeaddrinfo(resolved);

    if (sent < 0 || static_cast<size_t>(sent) != payload.size()) {
        send_failures_.fetch_add(1);
        utils::log::error(std::format("UDP emitter: sendto {} failed: {}",
                                      name(), std::strerror(errno)));
        return false;
    }

    documents_sent_.fetch_add(1);
    return true;
}

} // namespace xrayot
