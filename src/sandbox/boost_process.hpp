#pragma once

#include <boost/version.hpp>

// Boost 1.86 moved the original Boost.Process API under boost::process::v1.
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
namespace evalbox {
namespace bp = boost::process::v1;
}  // namespace evalbox
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
namespace evalbox {
namespace bp = boost::process;
}  // namespace evalbox
#endif
