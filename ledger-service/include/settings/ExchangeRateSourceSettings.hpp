#pragma once

#include "settings/IExchangeRateSourceSettings.hpp"
#include <cstdlib>
#include <string>

namespace ledger::settings {

/**
 * @brief Адрес одного API курсов
 *
 * Читает из ENV <prefix>_HOST и <prefix>_PORT, например
 * RATES_PRIMARY_HOST / RATES_PRIMARY_PORT.
 */
class ExchangeRateSourceSettings : public IExchangeRateSourceSettings {
public:
    ExchangeRateSourceSettings(std::string name, const std::string& envPrefix,
                               std::string defaultHost, int defaultPort)
        : name_(std::move(name))
        , host_(std::move(defaultHost))
        , port_(defaultPort)
    {
        if (const char* host = std::getenv((envPrefix + "_HOST").c_str())) {
            host_ = host;
        }
        if (const char* port = std::getenv((envPrefix + "_PORT").c_str())) {
            port_ = std::stoi(port);
        }
    }

    static ExchangeRateSourceSettings primary() {
        return ExchangeRateSourceSettings("primary", "RATES_PRIMARY", "rates-primary", 8080);
    }

    static ExchangeRateSourceSettings fallback() {
        return ExchangeRateSourceSettings("fallback", "RATES_FALLBACK", "rates-fallback", 8080);
    }

    std::string getName() const override { return name_; }
    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }

private:
    std::string name_;
    std::string host_;
    int port_;
};

} // namespace ledger::settings
