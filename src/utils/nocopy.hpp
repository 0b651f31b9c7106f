#pragma once

/* base for types that own a resource, like a mapping or a thread */
struct nocopy_t {
public:
  inline nocopy_t()
  {}

  nocopy_t(const nocopy_t&) = delete;
  nocopy_t& operator=(const nocopy_t&) = delete;
};
