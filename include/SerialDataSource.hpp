#pragma once
#include "IDataSource.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>
#include <boost/asio/streambuf.hpp>

#include <string>

// Decodes one newline-delimited frame. Strips a trailing '\r'.
// Returns false for a blank line, throws std::runtime_error on bad JSON.
bool frameFromLine(std::string line, PoseFrame& out);

// Takes the next line out of buf, or the unterminated remainder once the
// stream has ended. Returns false when buf is empty.
bool nextLine(boost::asio::streambuf& buf, std::string& line);

// Live keypoint stream from the pose estimator bridge, one JSON frame per line.
// Malformed lines are logged to stderr and skipped.
class SerialDataSource : public IDataSource {
public:
  // device: "/dev/ttyUSB0" on Linux, "COM12" on Windows
  SerialDataSource(const std::string& device, unsigned int baud = 115200);

  bool next(PoseFrame& out) override;

  int skippedLines() const { return skipped_; }

private:
  boost::asio::io_context io_;
  boost::asio::serial_port port_;
  boost::asio::streambuf buffer_;
  bool eof_ = false;
  int skipped_ = 0;
};
