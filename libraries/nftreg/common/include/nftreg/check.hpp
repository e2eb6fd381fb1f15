#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace nftreg
{
   /// Abort the current action with `message`
   ///
   /// Message should be UTF8.
   [[noreturn]] inline void abortMessage(std::string_view message)
   {
      throw std::runtime_error((std::string)message);
   }

   /// Abort with message if `!cond`
   ///
   /// Message should be UTF8.
   inline void check(bool cond, std::string_view message)
   {
      if (!cond)
         abortMessage(message);
   }

   /// Abort with `message` followed by `detail` if `!cond`
   inline void check(bool cond, std::string_view message, std::string_view detail)
   {
      if (!cond)
      {
         std::string full{message};
         full += ": ";
         full += detail;
         abortMessage(full);
      }
   }
}  // namespace nftreg
