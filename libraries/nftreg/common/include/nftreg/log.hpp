#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>

namespace nftreg
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      using common_logger = boost::log::sources::severity_logger_mt<level>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

      // Replaces all sinks with a console sink that writes records at or
      // above `minLevel` to stderr.
      void configure(level minLevel);
      // Reads `logger.level` if present
      void configure(const boost::program_options::variables_map&);
      void configure_default();
   }  // namespace loggers

#define NFTREG_LOG(logger, log_level) BOOST_LOG_SEV(logger, nftreg::loggers::level::log_level)
}  // namespace nftreg
