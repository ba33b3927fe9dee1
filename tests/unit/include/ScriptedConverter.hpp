#pragma once

#include "preview/Converter.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ds::test {

// Fails the first `failuresBeforeSuccess` calls, then succeeds.
class ScriptedConverter final : public preview::Converter {
public:
    explicit ScriptedConverter(const unsigned int failuresBeforeSuccess = 0, std::string error = "gotenberg unavailable")
        : remainingFailures_(failuresBeforeSuccess), error_(std::move(error)) {}

    std::string convert(const fs::model::File& file) override {
        std::scoped_lock lock(mutex_);
        ++calls_;
        converted_.push_back(file.id);
        if (remainingFailures_ > 0) {
            --remainingFailures_;
            throw std::runtime_error(error_);
        }
        return "owner-1/previews/" + file.id + ".pdf";
    }

    void failNext(const unsigned int n) {
        std::scoped_lock lock(mutex_);
        remainingFailures_ = n;
    }

    [[nodiscard]] unsigned int calls() const {
        std::scoped_lock lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::vector<std::string> converted() const {
        std::scoped_lock lock(mutex_);
        return converted_;
    }

private:
    mutable std::mutex mutex_;
    unsigned int remainingFailures_;
    std::string error_;
    unsigned int calls_{0};
    std::vector<std::string> converted_;
};

}
