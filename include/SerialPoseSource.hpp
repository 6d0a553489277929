#pragma once
#include "IPoseSource.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>
#include <boost/asio/streambuf.hpp>

#include <string>

// One JSON frame per line from a tracker on a serial port, e.g.
// {"t":0.016,"position":{"x":0.01,"y":-0.02,"z":0.40}}
class SerialPoseSource : public IPoseSource {
public:
  static constexpr unsigned kDefaultBaud = 115200;

  // Throws boost::system::system_error if the port cannot be opened.
  SerialPoseSource(const std::string& port, unsigned baud = kDefaultBaud);

  // Blocks for the next parsable line; false once the port fails or closes.
  bool next(SensorFrame& out) override;

  size_t skipped() const { return skipped_; }

private:
  boost::asio::io_context io_;
  boost::asio::serial_port port_;
  boost::asio::streambuf buffer_;
  size_t skipped_ = 0;
};
