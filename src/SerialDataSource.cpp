#include "SerialDataSource.hpp"
#include "PoseFrameJson.hpp"

#include <nlohmann/json.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/system/system_error.hpp>

#include <iostream>
#include <istream>
#include <stdexcept>

namespace asio = boost::asio;
using json = nlohmann::json;

bool frameFromLine(std::string line, PoseFrame& out) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (line.empty()) {
    return false;
  }

  json j = json::parse(line, nullptr, false);
  if (j.is_discarded()) {
    throw std::runtime_error("Malformed frame line");
  }

  out = poseFrameFromJson(j);
  return true;
}

bool nextLine(asio::streambuf& buf, std::string& line) {
  if (buf.size() == 0) {
    return false;
  }
  std::istream is(&buf);
  std::getline(is, line);  // consume one line
  return true;
}

SerialDataSource::SerialDataSource(const std::string& device, unsigned int baud)
  : port_(io_) {
  port_.open(device);

  port_.set_option(asio::serial_port_base::baud_rate(baud));
  port_.set_option(asio::serial_port_base::character_size(8));
  port_.set_option(
      asio::serial_port_base::flow_control(
          asio::serial_port_base::flow_control::none));
  port_.set_option(
      asio::serial_port_base::parity(
          asio::serial_port_base::parity::none));
  port_.set_option(
      asio::serial_port_base::stop_bits(
          asio::serial_port_base::stop_bits::one));

  std::cerr << "Opened serial port " << device << " @ " << baud << "\n";
}

bool SerialDataSource::next(PoseFrame& out) {
  for (;;) {
    if (!eof_) {
      boost::system::error_code ec;
      asio::read_until(port_, buffer_, '\n', ec);

      if (ec == asio::error::eof) {
        eof_ = true;   // a last frame may still sit in buffer_ without '\n'
      } else if (ec) {
        throw boost::system::system_error(ec, "serial read");
      }
    }

    std::string line;
    if (!nextLine(buffer_, line)) {
      return false;
    }

    try {
      if (frameFromLine(line, out)) {
        return true;
      }
    } catch (const std::exception& e) {
      skipped_++;
      std::cerr << "Skipping frame: " << e.what() << "\n";
    }
  }
}
