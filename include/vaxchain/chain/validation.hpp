#pragma once

#include <cctype>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/common/error.hpp"

namespace vaxchain::chain {

    /// Letters and spaces only, at least one character
    inline bool isValidName(const std::string &value) {
        if (value.empty())
            return false;
        for (unsigned char c : value) {
            if (!std::isalpha(c) && c != ' ')
                return false;
        }
        return true;
    }

    /// Decimal digits only, at least one character
    inline bool isValidNumber(const std::string &value) {
        if (value.empty())
            return false;
        for (unsigned char c : value) {
            if (!std::isdigit(c))
                return false;
        }
        return true;
    }

    inline bool isValidEmail(const std::string &value) {
        auto at = value.find('@');
        if (at == std::string::npos || at == 0 || value.find('@', at + 1) != std::string::npos)
            return false;

        std::string local = value.substr(0, at);
        std::string domain = value.substr(at + 1);
        for (unsigned char c : local) {
            if (!std::isalnum(c) && std::string("!#$%&'*+/=?^_`{|}~.-").find(static_cast<char>(c)) == std::string::npos)
                return false;
        }
        if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string::npos)
            return false;

        // domain: dot-separated labels of letters, digits and inner hyphens, at least two labels
        size_t labels = 0;
        size_t start = 0;
        while (start <= domain.size()) {
            size_t dot = domain.find('.', start);
            std::string label = domain.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (label.empty() || label.front() == '-' || label.back() == '-')
                return false;
            for (unsigned char c : label) {
                if (!std::isalnum(c) && c != '-')
                    return false;
            }
            ++labels;
            if (dot == std::string::npos)
                break;
            start = dot + 1;
        }
        return labels >= 2;
    }

    /// Collects every failing field, then reports them in one ValidationError
    class FieldCheck {
      public:
        inline FieldCheck &require(const char *field, bool ok, const char *reason) {
            if (!ok)
                failures_.push_back(std::string(field) + " " + reason);
            return *this;
        }

        inline bool ok() const { return failures_.empty(); }

        inline dp::Result<void, dp::Error> result() const {
            if (failures_.empty())
                return dp::Result<void, dp::Error>::ok();
            std::string message = "Invalid input: ";
            for (size_t i = 0; i < failures_.size(); ++i) {
                if (i > 0)
                    message += "; ";
                message += failures_[i];
            }
            return dp::Result<void, dp::Error>::err(validation_error(errorText(message)));
        }

      private:
        std::vector<std::string> failures_;
    };

} // namespace vaxchain::chain
