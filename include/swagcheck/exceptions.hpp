#pragma once
#include <stdexcept>
#include <string>

namespace swagcheck
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct SchemaError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

} // namespace swagcheck
