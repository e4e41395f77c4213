#ifndef __PE_SERIAL_CHANNEL__
#define __PE_SERIAL_CHANNEL__

#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>

#include "ChildChannel.hpp"

namespace pe {
/** @brief Line settings applied when a serial device is opened. */
struct SerialOptions {
  unsigned int baudRate = 9600;
  unsigned int characterSize = 8;
  boost::asio::serial_port_base::parity::type parity =
      boost::asio::serial_port_base::parity::none;
  boost::asio::serial_port_base::stop_bits::type stopBits =
      boost::asio::serial_port_base::stop_bits::one;
  boost::asio::serial_port_base::flow_control::type flowControl =
      boost::asio::serial_port_base::flow_control::none;

  /** @brief Parses "none", "odd" or "even". */
  static boost::asio::serial_port_base::parity::type parseParity(
      const string& s);
  /** @brief Parses "1", "1.5" or "2". */
  static boost::asio::serial_port_base::stop_bits::type parseStopBits(
      const string& s);
  /** @brief Parses "none", "software" or "hardware". */
  static boost::asio::serial_port_base::flow_control::type parseFlowControl(
      const string& s);
};

/**
 * @brief A serial device opened through Boost.Asio.  Reads and writes are
 * synchronous; readiness is polled on the native handle so the expect loop
 * can bound each wait.
 */
class SerialChannel : public ChildChannel {
 public:
  /** @throws SpawnError if the device cannot be opened or configured. */
  SerialChannel(const string& _device, const SerialOptions& options);
  virtual ~SerialChannel();

  virtual int getFd();
  virtual string getName() { return "serial port " + device; }

  virtual ssize_t read(char* buf, size_t count);
  virtual void write(const char* buf, size_t count);

  /** @brief The port counts as alive while it is open. */
  virtual optional<ChildExit> pollExit();
  virtual ChildExit waitExit();

  /** @brief Drains pending output, then closes the port. */
  virtual void closeChannel();
  virtual void teardown() { closeChannel(); }

  virtual void flush();

 protected:
  string device;
  boost::asio::io_context ioContext;
  boost::asio::serial_port port;
};
}  // namespace pe

#endif  // __PE_SERIAL_CHANNEL__
