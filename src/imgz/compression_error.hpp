#pragma once

#include <stdexcept>

namespace imgz
{

class compression_error : public std::runtime_error
{
public:
  using runtime_error::runtime_error;
};

// Internal invariant broken while encoding
class encode_error : public compression_error
{
public:
  using compression_error::compression_error;
};

// Malformed, truncated or corrupt compressed stream
class decode_error : public compression_error
{
public:
  using compression_error::compression_error;
};

class invalid_level_error : public compression_error
{
public:
  using compression_error::compression_error;
};

class configuration_error : public compression_error
{
public:
  using compression_error::compression_error;
};

class unknown_algorithm_error : public compression_error
{
public:
  using compression_error::compression_error;
};

class io_error : public std::runtime_error
{
public:
  using runtime_error::runtime_error;
};

} // namespace imgz
