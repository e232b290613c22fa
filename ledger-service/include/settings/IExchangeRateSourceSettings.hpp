#pragma once

#include <string>

namespace ledger::settings {

class IExchangeRateSourceSettings {
public:
    virtual ~IExchangeRateSourceSettings() = default;

    virtual std::string getName() const = 0;
    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
};

} // namespace ledger::settings
