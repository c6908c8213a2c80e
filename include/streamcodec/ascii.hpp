#pragma once

namespace streamcodec::ascii {

constexpr char kLf = '\x0a';
constexpr char kCr = '\x0d';
constexpr char kRs = '\x1e';
constexpr char kColon = '\x3a';
constexpr char kSpace = '\x20';

}  // namespace streamcodec::ascii
