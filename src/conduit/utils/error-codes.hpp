
#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup conduit-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // No such operation!
 * return make_unexpected(make_error_code(ecode::unknown_operation));
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace conduit
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of conduit error codes.
 */
enum class ecode : int {
   okay = 0,           //!< i.e., everything's okay.
   logic_error,        //!< Faulty logic in the program.
   argument_error,     //!< An invalid argument was supplied.
   invalid_data,       //!< Input data (file/network/etc.) was invalid.

   invalid_name,        //!< Not an identifier: `^[A-Za-z]\w*$`
   bad_description,     //!< Malformed api/operation description.
   bad_endpoint,        //!< Endpoint is missing a part, or has a bad pattern.
   unknown_operation,   //!< Operation is not in the description.
   already_bound,       //!< Operation already has a handler.
   missing_handler,     //!< Operation has no handler.
   invalid_scope,       //!< Plugin signature does not fit the scope.
   registry_finalized,  //!< Plugin added after the first call.
   already_processed,   //!< Processor invoked a second time.
   continuation_reused, //!< `Context::next()` called twice by one plugin.
   transport_error,     //!< Could not deliver a request, or read its response.
   invalid_response     //!< Response payload was malformed or incomplete.
};
} // namespace conduit

namespace std
{
template<> struct is_error_code_enum<conduit::ecode> : true_type
{};
} // namespace std

namespace conduit
{
error_code make_error_code(ecode);
const std::error_category& ecode_category() noexcept;
} // namespace conduit
