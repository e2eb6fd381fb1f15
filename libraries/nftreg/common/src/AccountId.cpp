#include <nftreg/AccountId.hpp>

namespace nftreg
{
   namespace
   {
      bool isSeparator(char ch)
      {
         return ch == '-' || ch == '_' || ch == '.';
      }

      bool isAlphaNumeric(char ch)
      {
         return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
      }
   }  // namespace

   bool isValidAccountId(std::string_view s)
   {
      if (s.size() < AccountId::minLength || s.size() > AccountId::maxLength)
         return false;

      // Separators are only allowed between two alphanumeric characters
      bool lastWasSeparator = true;
      for (char ch : s)
      {
         if (isSeparator(ch))
         {
            if (lastWasSeparator)
               return false;
            lastWasSeparator = true;
         }
         else if (isAlphaNumeric(ch))
         {
            lastWasSeparator = false;
         }
         else
         {
            return false;
         }
      }
      return !lastWasSeparator;
   }
}  // namespace nftreg
