#include "SerialPoseSource.hpp"
#include "FrameJson.hpp"

#include <boost/asio/read_until.hpp>
#include <nlohmann/json.hpp>

#include <istream>

namespace asio = boost::asio;
using json = nlohmann::json;

SerialPoseSource::SerialPoseSource(const std::string& port, unsigned baud)
  : port_(io_, port) {
  port_.set_option(asio::serial_port_base::baud_rate(baud));
  port_.set_option(asio::serial_port_base::character_size(8));
  port_.set_option(
    asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none));
  port_.set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::none));
  port_.set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one));
}

bool SerialPoseSource::next(SensorFrame& out) {
  for (;;) {
    boost::system::error_code ec;
    asio::read_until(port_, buffer_, '\n', ec);
    if (ec) return false;

    std::istream is(&buffer_);
    std::string line;
    std::getline(is, line);

    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !frame_from_json(j, out)) {
      skipped_++;
      continue;
    }
    return true;
  }
}
