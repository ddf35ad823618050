#pragma once

#include <stdexcept>

namespace ChannelKey::Token
{
    class TokenError : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };

    /// Application id or secret is not configured at all.
    class MissingConfiguration : public TokenError
    {
      public:
        using TokenError::TokenError;
    };

    /// Application id or secret is present but not exactly CredentialLength characters.
    class InvalidCredentials : public TokenError
    {
      public:
        using TokenError::TokenError;
    };

    /// A length prefixed field or element count does not fit its 16 bit prefix.
    class EncodingOverflow : public TokenError
    {
      public:
        using TokenError::TokenError;
    };
}
