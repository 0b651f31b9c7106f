#include "xpu.hpp"
#include "xpu/cpu.hpp"

xpu_t::~xpu_t() {
}

std::vector<xpu_t::scoped_t> xpu_t::discover(const parsed_options_t& options) {
  std::vector<scoped_t> out;
  out.emplace_back(cpu_t::make(options));
  return out;
}
