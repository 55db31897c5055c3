/** Mart error definitions file
 *  Description: Error codes and the assert helpers used by the marketplace contracts. Every
 *  helper aborts the transaction with a JSON message naming the error type, the offending
 *  field and its value.
 *  @file mart.errors.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <string>

namespace martio {

    using std::string;

    constexpr uint64_t ident = uint64_t(0x4d52) << 48; // "MR"

    constexpr uint64_t httpValidationError = uint64_t(400) << 32;
    constexpr uint64_t httpPaymentError    = uint64_t(402) << 32;
    constexpr uint64_t httpAuthError       = uint64_t(403) << 32;
    constexpr uint64_t httpStateError      = uint64_t(409) << 32;
    constexpr uint64_t httpLockedError     = uint64_t(423) << 32;
    constexpr uint64_t httpTransferError   = uint64_t(424) << 32;

    // validation
    constexpr auto ErrorInvalidPrice         = ident | httpValidationError | 101;
    constexpr auto ErrorInvalidAmount        = ident | httpValidationError | 102;
    constexpr auto ErrorInvalidAssetKind     = ident | httpValidationError | 103;
    constexpr auto ErrorKindAmountMismatch   = ident | httpValidationError | 104;
    constexpr auto ErrorInvalidAssetContract = ident | httpValidationError | 105;
    constexpr auto ErrorInvalidFee           = ident | httpValidationError | 106;
    constexpr auto ErrorInvalidRecipient     = ident | httpValidationError | 107;
    constexpr auto ErrorInvalidOwner         = ident | httpValidationError | 108;
    constexpr auto ErrorInvalidBatch         = ident | httpValidationError | 109;
    constexpr auto ErrorBatchOverflow        = ident | httpValidationError | 110;
    constexpr auto ErrorInvalidEBreak        = ident | httpValidationError | 111;

    // payment
    constexpr auto ErrorPaymentMismatch      = ident | httpPaymentError | 201;

    // authorization
    constexpr auto ErrorNotSeller            = ident | httpAuthError | 301;
    constexpr auto ErrorNotOwner             = ident | httpAuthError | 302;

    // state
    constexpr auto ErrorListingNotFound      = ident | httpStateError | 401;
    constexpr auto ErrorListingInactive      = ident | httpStateError | 402;
    constexpr auto ErrorNotInitialized       = ident | httpStateError | 403;
    constexpr auto ErrorAlreadyInitialized   = ident | httpStateError | 404;
    constexpr auto ErrorEBreakEnabled        = ident | httpStateError | 405;
    constexpr auto ErrorNotLocked            = ident | httpStateError | 406;

    // reentrancy
    constexpr auto ErrorReentrantCall        = ident | httpLockedError | 501;

    // transfer
    constexpr auto ErrorInsufficientCustody  = ident | httpTransferError | 601;
    constexpr auto ErrorAlreadyInCustody     = ident | httpTransferError | 602;

    inline string error_message(const char *type, const char *field, const string &value,
                                const char *message, const uint64_t code) {
        return string("{\"type\": \"") + type + "\", \"code\": " + std::to_string(code) +
               ", \"field\": \"" + field + "\", \"value\": \"" + value +
               "\", \"message\": \"" + message + "\"}";
    }

    inline void mart_assert(bool test, const char *type, const char *field, const string &value,
                            const char *message, const uint64_t code) {
        if (!test) {
            eosio::check(false, error_message(type, field, value, message, code));
        }
    }

    inline void mart_400_assert(bool test, const char *field, const string &value,
                                const char *message, const uint64_t code) {
        mart_assert(test, "validation_error", field, value, message, code);
    }

    inline void mart_402_assert(bool test, const char *field, const string &value,
                                const char *message, const uint64_t code) {
        mart_assert(test, "payment_error", field, value, message, code);
    }

    inline void mart_403_assert(bool test, const char *field, const string &value,
                                const char *message, const uint64_t code) {
        mart_assert(test, "authorization_error", field, value, message, code);
    }

    inline void mart_409_assert(bool test, const char *field, const string &value,
                                const char *message, const uint64_t code) {
        mart_assert(test, "state_error", field, value, message, code);
    }

    inline void mart_423_assert(bool test, const char *field, const string &value,
                                const char *message, const uint64_t code) {
        mart_assert(test, "reentrancy_error", field, value, message, code);
    }

    inline void mart_424_assert(bool test, const char *field, const string &value,
                                const char *message, const uint64_t code) {
        mart_assert(test, "transfer_failure", field, value, message, code);
    }
}
