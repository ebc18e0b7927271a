#pragma once

#include <streambuf>

namespace shoreline::runner {

// Writes every character to both buffers
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace shoreline::runner
