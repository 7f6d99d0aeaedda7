#include "transport_hidraw.hpp"
#include "glider_error.hpp"

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

#include <dirent.h>
#include <fcntl.h>
#include <linux/hidraw.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

static const char* HIDRAW_CLASS_DIR = "/sys/class/hidraw";

static std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

HidrawTransport::HidrawTransport(const std::string& device_path,
                                 uint16_t vendor_id, uint16_t product_id)
    : device_path_(device_path), vendor_id_(vendor_id), product_id_(product_id) {}

HidrawTransport::~HidrawTransport() {
    close();
}

void HidrawTransport::open() {
    if (fd_ >= 0) return;
    if (device_path_.empty()) {
        fd_ = open_matching_node();
        return;
    }

    fd_ = ::open(device_path_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        throw TransportUnavailableError(errno_message("Failed to open " + device_path_));
    }
}

int HidrawTransport::open_matching_node() {
    std::ostringstream not_found;
    not_found << "Display controller " << std::hex << std::setw(4) << std::setfill('0')
              << vendor_id_ << ":" << std::setw(4) << product_id_
              << " not found (is it connected?)";

    DIR* dir = ::opendir(HIDRAW_CLASS_DIR);
    if (!dir) {
        throw TransportUnavailableError(not_found.str());
    }

    int found = -1;
    while (dirent* entry = ::readdir(dir)) {
        std::string name = entry->d_name;
        if (name.compare(0, 6, "hidraw") != 0) continue;

        std::string path = "/dev/" + name;
        int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
        if (fd < 0) continue;  // no permission or gone, try the next node

        hidraw_devinfo info{};
        if (::ioctl(fd, HIDIOCGRAWINFO, &info) == 0 &&
            static_cast<uint16_t>(info.vendor) == vendor_id_ &&
            static_cast<uint16_t>(info.product) == product_id_) {
            found = fd;
            break;
        }
        ::close(fd);
    }
    ::closedir(dir);

    if (found < 0) {
        throw TransportUnavailableError(not_found.str());
    }
    return found;
}

void HidrawTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void HidrawTransport::write(const std::vector<uint8_t>& data) {
    if (fd_ < 0) {
        throw TransportIoError("Display controller not open");
    }

    // hidraw takes the report number as first byte and drops report 0 itself
    ssize_t ret = ::write(fd_, data.data(), data.size());
    if (ret < 0) {
        throw TransportIoError(errno_message("hidraw write failed"));
    }
    if ((size_t)ret != data.size()) {
        std::ostringstream oss;
        oss << "hidraw write incomplete (" << ret << "/" << data.size() << " bytes)";
        throw TransportIoError(oss.str());
    }
}

size_t HidrawTransport::read_timeout(uint8_t* buf, size_t len, int timeout_ms) {
    if (fd_ < 0) {
        throw TransportIoError("Display controller not open");
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int ret;
    do {
        ret = ::poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        throw TransportIoError(errno_message("hidraw poll failed"));
    }
    if (ret == 0) {
        std::ostringstream oss;
        oss << "No response from display controller within " << timeout_ms << " ms";
        throw TimeoutError(oss.str());
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        throw TransportIoError("hidraw device disconnected");
    }

    ssize_t n = ::read(fd_, buf, len);
    if (n < 0) {
        throw TransportIoError(errno_message("hidraw read failed"));
    }
    return (size_t)n;
}

// Factory function for hidraw backend
#ifdef GLIDER_BACKEND_HIDRAW
std::unique_ptr<HidTransport> create_hid_transport(const TransportOptions& options) {
    return std::make_unique<HidrawTransport>(options.device_path, options.vendor_id,
                                             options.product_id);
}
#endif
