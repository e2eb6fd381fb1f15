#include <nftreg/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace nftreg::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

   namespace
   {
      constexpr const char* level_names[] = {"debug", "info", "notice", "warning", "error"};

      template <typename S, typename T>
      void format_timestamp(S& os, const T& timestamp)
      {
         auto date = std::chrono::floor<std::chrono::days>(timestamp);
         auto ymd  = std::chrono::year_month_day(date);
         auto time = std::chrono::hh_mm_ss(
             std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - date));
         os << std::setfill('0');
         os << std::setw(4) << (int)ymd.year() << '-' << std::setw(2) << (unsigned)ymd.month()
            << '-' << std::setw(2) << (unsigned)ymd.day();
         os << 'T' << std::setw(2) << time.hours().count() << ':' << std::setw(2)
            << time.minutes().count() << ':' << std::setw(2) << time.seconds().count() << '.'
            << std::setw(3) << time.subseconds().count() << 'Z';
         os << std::setfill(' ');
      }

      auto text_formatter =
          [](const boost::log::record_view& rec, boost::log::formatting_ostream& os)
      {
         if (auto timestamp =
                 boost::log::extract<std::chrono::system_clock::time_point>("TimeStamp", rec))
         {
            format_timestamp(os, *timestamp);
            os << ' ';
         }
         if (auto l = boost::log::extract<level>("Severity", rec))
         {
            os << '[' << *l << "]: ";
         }
         os << rec[boost::log::expressions::smessage];
      };
   }  // namespace

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      auto idx = static_cast<std::uint32_t>(l);
      if (idx < std::size(level_names))
         os << level_names[idx];
      else
         os << idx;
      return os;
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string name;
      if (is >> name)
      {
         for (std::uint32_t i = 0; i < std::size(level_names); ++i)
         {
            if (name == level_names[i])
            {
               l = static_cast<level>(i);
               return is;
            }
         }
         is.setstate(std::ios_base::failbit);
      }
      return is;
   }

   void configure(level minLevel)
   {
      using backend_type = boost::log::sinks::text_ostream_backend;
      using sink_type    = boost::log::sinks::synchronous_sink<backend_type>;

      auto core = boost::log::core::get();
      core->remove_all_sinks();
      core->add_global_attribute(
          "TimeStamp", boost::log::attributes::make_function(
                           [] { return std::chrono::system_clock::now(); }));

      auto backend = boost::make_shared<backend_type>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      auto sink = boost::make_shared<sink_type>(backend);
      sink->set_formatter(text_formatter);
      sink->set_filter(boost::log::expressions::attr<level>("Severity") >= minLevel);
      core->add_sink(sink);
   }

   void configure(const boost::program_options::variables_map& vm)
   {
      if (auto iter = vm.find("logger.level"); iter != vm.end())
         configure(iter->second.as<level>());
      else
         configure_default();
   }

   void configure_default()
   {
      configure(level::info);
   }
}  // namespace nftreg::loggers
