#include "LedgerApp.hpp"

// Application Services
#include "application/AccountService.hpp"
#include "application/JournalService.hpp"
#include "application/LedgerQueryService.hpp"
#include "application/PostingEngine.hpp"
#include "application/TrialBalanceService.hpp"

// Secondary Adapters
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryJournalRepository.hpp"
#include "adapters/secondary/persistence/PostgresAccountRepository.hpp"
#include "adapters/secondary/persistence/PostgresJournalRepository.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

namespace ledger {

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp()
    : LedgerApp(std::make_shared<settings::LedgerSettings>())
{
}

LedgerApp::LedgerApp(std::shared_ptr<settings::LedgerSettings> settings)
    : settings_(std::move(settings))
{
    std::cout << "[LedgerApp] Application created: storage=" << settings_->getStorage()
              << ", currency=" << settings_->getFunctionalCurrency()
              << ", fiscal year starts in month " << settings_->getFiscalYearStartMonth()
              << std::endl;
    configureInjection();
}

LedgerApp::~LedgerApp()
{
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

void LedgerApp::configureInjection()
{
    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    if (settings_->getStorage() == "postgres") {
        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Secondary Adapters (Output Ports implementations)
            // ================================================================

            di::bind<settings::ILedgerSettings>().to(settings_),

            di::bind<settings::DbSettings>().to(std::make_shared<settings::DbSettings>()),

            di::bind<ports::output::IEventBus>()
                .to<adapters::secondary::InMemoryEventBus>()
                .in(di::singleton),

            // IAccountRepository ← PostgresAccountRepository(DbSettings)
            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::PostgresAccountRepository>()
                .in(di::singleton),

            // IJournalRepository ← PostgresJournalRepository(DbSettings)
            di::bind<ports::output::IJournalRepository>()
                .to<adapters::secondary::PostgresJournalRepository>()
                .in(di::singleton),

            // ================================================================
            // Layer 2: Application Services (Input Ports implementations)
            // ================================================================

            di::bind<application::PostingEngine>().in(di::singleton),

            di::bind<ports::input::IAccountService>()
                .to<application::AccountService>()
                .in(di::singleton),

            di::bind<ports::input::IJournalService>()
                .to<application::JournalService>()
                .in(di::singleton),

            di::bind<ports::input::ITrialBalanceService>()
                .to<application::TrialBalanceService>()
                .in(di::singleton),

            di::bind<ports::input::ILedgerQueryService>()
                .to<application::LedgerQueryService>()
                .in(di::singleton));

        resolveServices(injector);
        std::cout << "[LedgerApp] PostgreSQL repositories bound" << std::endl;
    } else {
        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Secondary Adapters (Output Ports implementations)
            // ================================================================

            di::bind<settings::ILedgerSettings>().to(settings_),

            di::bind<ports::output::IEventBus>()
                .to<adapters::secondary::InMemoryEventBus>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::InMemoryAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IJournalRepository>()
                .to<adapters::secondary::InMemoryJournalRepository>()
                .in(di::singleton),

            // ================================================================
            // Layer 2: Application Services (Input Ports implementations)
            // ================================================================

            di::bind<application::PostingEngine>().in(di::singleton),

            di::bind<ports::input::IAccountService>()
                .to<application::AccountService>()
                .in(di::singleton),

            di::bind<ports::input::IJournalService>()
                .to<application::JournalService>()
                .in(di::singleton),

            di::bind<ports::input::ITrialBalanceService>()
                .to<application::TrialBalanceService>()
                .in(di::singleton),

            di::bind<ports::input::ILedgerQueryService>()
                .to<application::LedgerQueryService>()
                .in(di::singleton));

        resolveServices(injector);
        std::cout << "[LedgerApp] In-memory repositories bound" << std::endl;
    }

    std::cout << "[LedgerApp] DI configuration completed" << std::endl;
}

template <typename Injector>
void LedgerApp::resolveServices(Injector& injector)
{
    eventBus_ = injector.template create<std::shared_ptr<ports::output::IEventBus>>();
    postingEngine_ = injector.template create<std::shared_ptr<application::PostingEngine>>();
    accountService_ = injector.template create<std::shared_ptr<ports::input::IAccountService>>();
    journalService_ = injector.template create<std::shared_ptr<ports::input::IJournalService>>();
    trialBalanceService_ =
        injector.template create<std::shared_ptr<ports::input::ITrialBalanceService>>();
    ledgerQueryService_ =
        injector.template create<std::shared_ptr<ports::input::ILedgerQueryService>>();
}

} // namespace ledger
