#pragma once

#include <string_view>

namespace UserService
{
   namespace Errors
   {
      constexpr std::string_view tokenAlreadyExists  = "Token ID already exists";
      constexpr std::string_view tokenNotFound       = "Token not found";
      constexpr std::string_view unauthorized        = "Unauthorized";
      constexpr std::string_view ownerMismatch       = "Token is not owned by the expected owner";
      constexpr std::string_view selfTransfer        = "Current and next owner must differ";
      constexpr std::string_view approvalNotFound    = "Account is not approved for this token";
      constexpr std::string_view staleApproval       = "Approval ID does not match";
      constexpr std::string_view insufficientDeposit = "Insufficient storage deposit";
      constexpr std::string_view approvalIdOverflow  = "Approval ID overflow";
      constexpr std::string_view amountOverflow      = "Amount overflow";
      constexpr std::string_view outOfBounds         = "Out of bounds, please use a smaller from_index";
      constexpr std::string_view zeroLimit           = "Cannot provide limit of 0";
      constexpr std::string_view invalidAccount      = "Invalid account ID";
      constexpr std::string_view uninitialized       = "Service not initialized";
      constexpr std::string_view alreadyInit         = "Service already initialized";
   }  // namespace Errors
}  // namespace UserService
