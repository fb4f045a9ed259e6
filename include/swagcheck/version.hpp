#pragma once

namespace swagcheck
{

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 2;
constexpr int VERSION_PATCH = 0;

} // namespace swagcheck
