#include "SerialChannel.hpp"

#include <boost/asio/write.hpp>

namespace pe {
using boost::asio::serial_port_base;

serial_port_base::parity::type SerialOptions::parseParity(const string& s) {
  if (s == "none") return serial_port_base::parity::none;
  if (s == "odd") return serial_port_base::parity::odd;
  if (s == "even") return serial_port_base::parity::even;
  throw std::runtime_error("Invalid parity: " + s);
}

serial_port_base::stop_bits::type SerialOptions::parseStopBits(
    const string& s) {
  if (s == "1") return serial_port_base::stop_bits::one;
  if (s == "1.5") return serial_port_base::stop_bits::onepointfive;
  if (s == "2") return serial_port_base::stop_bits::two;
  throw std::runtime_error("Invalid stop bits: " + s);
}

serial_port_base::flow_control::type SerialOptions::parseFlowControl(
    const string& s) {
  if (s == "none") return serial_port_base::flow_control::none;
  if (s == "software") return serial_port_base::flow_control::software;
  if (s == "hardware") return serial_port_base::flow_control::hardware;
  throw std::runtime_error("Invalid flow control: " + s);
}

SerialChannel::SerialChannel(const string& _device,
                             const SerialOptions& options)
    : device(_device), port(ioContext) {
  boost::system::error_code ec;
  port.open(device, ec);
  if (ec) {
    throw SpawnError("Cannot open " + device + ": " + ec.message());
  }
  try {
    port.set_option(serial_port_base::baud_rate(options.baudRate));
    port.set_option(serial_port_base::character_size(options.characterSize));
    port.set_option(serial_port_base::parity(options.parity));
    port.set_option(serial_port_base::stop_bits(options.stopBits));
    port.set_option(serial_port_base::flow_control(options.flowControl));
  } catch (const boost::system::system_error& sse) {
    port.close(ec);
    throw SpawnError("Cannot configure " + device + ": " + sse.what());
  }
  LOG(INFO) << "Opened " << device << " at " << options.baudRate << " baud";
}

SerialChannel::~SerialChannel() {
  if (port.is_open()) {
    boost::system::error_code ec;
    port.close(ec);
  }
}

int SerialChannel::getFd() {
  if (!port.is_open()) {
    return -1;
  }
  return port.native_handle();
}

ssize_t SerialChannel::read(char* buf, size_t count) {
  if (!port.is_open()) {
    throw SessionClosedError(getName() + " is closed");
  }
  boost::system::error_code ec;
  size_t n = port.read_some(boost::asio::buffer(buf, count), ec);
  if (ec == boost::asio::error::eof) {
    return 0;
  }
  if (ec) {
    if (ec.value() == EIO) {
      // The other end of a pty-backed line went away
      return 0;
    }
    throw std::runtime_error("Serial read error on " + device + ": " +
                             ec.message());
  }
  return (ssize_t)n;
}

void SerialChannel::write(const char* buf, size_t count) {
  if (!port.is_open()) {
    throw SessionClosedError(getName() + " is closed");
  }
  boost::system::error_code ec;
  boost::asio::write(port, boost::asio::buffer(buf, count), ec);
  if (ec) {
    throw std::runtime_error("Serial write error on " + device + ": " +
                             ec.message());
  }
}

optional<ChildExit> SerialChannel::pollExit() {
  if (port.is_open()) {
    return nullopt;
  }
  return ChildExit();
}

ChildExit SerialChannel::waitExit() {
  throw UnsupportedError("Cannot wait on " + getName() +
                         ", it has no process");
}

void SerialChannel::flush() {
  if (port.is_open() && tcdrain(port.native_handle()) == -1) {
    LOG(WARNING) << "tcdrain failed on " << device << ": "
                 << strerror(GetErrno());
  }
}

void SerialChannel::closeChannel() {
  if (!port.is_open()) {
    return;
  }
  flush();
  boost::system::error_code ec;
  port.close(ec);
  if (ec) {
    LOG(WARNING) << "Error closing " << device << ": " << ec.message();
  }
  VLOG(1) << "Closed " << device;
}
}  // namespace pe
