#pragma once

#include <memory>

// Forward declarations - Ports
namespace ledger::ports::input {
    class IAccountService;
    class IJournalService;
    class ITrialBalanceService;
    class ILedgerQueryService;
}

namespace ledger::ports::output {
    class IEventBus;
}

namespace ledger::application {
    class PostingEngine;
}

namespace ledger::settings {
    class LedgerSettings;
}

namespace ledger {

/**
 * @class LedgerApp
 * @brief Сборка учётного ядра
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: InMemory* или Postgres* репозитории, InMemoryEventBus
 * - Application Services: AccountService, JournalService,
 *   TrialBalanceService, LedgerQueryService
 *
 * Dependency Injection: Boost.DI
 * - Хранилище выбирается по settings.getStorage(): "memory" или "postgres"
 * - Singleton scope для всех адаптеров и сервисов
 */
class LedgerApp {
public:
    /**
     * @brief Собрать ядро по переменным окружения LEDGER_*
     */
    LedgerApp();

    explicit LedgerApp(std::shared_ptr<settings::LedgerSettings> settings);

    ~LedgerApp();

    std::shared_ptr<ports::input::IAccountService> accountService() const { return accountService_; }
    std::shared_ptr<ports::input::IJournalService> journalService() const { return journalService_; }
    std::shared_ptr<ports::input::ITrialBalanceService> trialBalanceService() const {
        return trialBalanceService_;
    }
    std::shared_ptr<ports::input::ILedgerQueryService> ledgerQueryService() const {
        return ledgerQueryService_;
    }
    std::shared_ptr<application::PostingEngine> postingEngine() const { return postingEngine_; }
    std::shared_ptr<ports::output::IEventBus> eventBus() const { return eventBus_; }
    std::shared_ptr<settings::LedgerSettings> settings() const { return settings_; }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;

    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<ports::input::IJournalService> journalService_;
    std::shared_ptr<ports::input::ITrialBalanceService> trialBalanceService_;
    std::shared_ptr<ports::input::ILedgerQueryService> ledgerQueryService_;
    std::shared_ptr<application::PostingEngine> postingEngine_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;

    /**
     * @brief Настроить Boost.DI контейнер под выбранное хранилище
     */
    void configureInjection();

    template <typename Injector>
    void resolveServices(Injector& injector);
};

} // namespace ledger
