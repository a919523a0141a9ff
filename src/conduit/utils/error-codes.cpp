
#include "error-codes.hpp"

#include <string>

namespace conduit
{
namespace
{
   /**
    * @private
    */
   struct ECodeCategory : std::error_category
   {
      const char* name() const noexcept override;
      std::string message(int ev) const override;
   };

   /**
    * @private
    */
   const char* ECodeCategory::name() const noexcept { return "conduit"; }

   /**
    * @private
    */
   std::string ECodeCategory::message(int e) const
   {
      switch(static_cast<ecode>(e)) {
      case ecode::okay: return "okay";
      case ecode::logic_error: return "logic error";
      case ecode::argument_error: return "argument error";
      case ecode::invalid_data: return "invalid data";
      case ecode::invalid_name: return "invalid name";
      case ecode::bad_description: return "bad description";
      case ecode::bad_endpoint: return "bad endpoint";
      case ecode::unknown_operation: return "unknown operation";
      case ecode::already_bound: return "operation already bound";
      case ecode::missing_handler: return "operation has no handler";
      case ecode::invalid_scope: return "invalid plugin scope";
      case ecode::registry_finalized: return "plugin registry is finalized";
      case ecode::already_processed: return "already processed";
      case ecode::continuation_reused: return "continuation invoked more than once";
      case ecode::transport_error: return "transport error";
      case ecode::invalid_response: return "invalid response";
      }
      return "(unknown error)";
   }

   /**
    * @private
    */
   static const ECodeCategory ecode_category_{};
} // namespace

/**
 * @ingroup error-codes
 * @brief The category of all `ecode` error codes.
 */
const std::error_category& ecode_category() noexcept { return ecode_category_; }

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category_}; }

} // namespace conduit
