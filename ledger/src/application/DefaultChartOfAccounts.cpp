#include "application/DefaultChartOfAccounts.hpp"

namespace ledger::application {

namespace {

using domain::AccountType;

DefaultAccountTemplate header(const std::string& code, const std::string& name, AccountType type,
                              const std::string& subType,
                              std::optional<std::string> parentCode = std::nullopt) {
    return DefaultAccountTemplate{code, name, type, subType, std::move(parentCode), true, std::nullopt, std::nullopt};
}

DefaultAccountTemplate systemAccount(const std::string& code, const std::string& name, AccountType type,
                                     const std::string& subType, const std::string& parentCode,
                                     const std::string& systemKey,
                                     std::optional<std::string> currency = std::nullopt) {
    return DefaultAccountTemplate{code, name, type, subType, parentCode, false, systemKey, std::move(currency)};
}

} // namespace

const std::vector<DefaultAccountTemplate>& defaultChartOfAccounts() {
    static const std::vector<DefaultAccountTemplate> chart = {
        // Активы
        header("100000", "Assets", AccountType::ASSET, "current_asset"),
        header("110000", "Cash and Bank", AccountType::ASSET, "current_asset", "100000"),
        systemAccount("110001", "Cash on Hand", AccountType::ASSET, "current_asset", "110000", "CASH_ON_HAND"),
        systemAccount("110002", "Petty Cash", AccountType::ASSET, "current_asset", "110000", "PETTY_CASH"),
        systemAccount("111001", "Bank Account - UGX", AccountType::ASSET, "current_asset", "110000", "BANK_UGX"),
        systemAccount("111002", "Bank Account - USD", AccountType::ASSET, "current_asset", "110000", "BANK_USD", "USD"),
        header("120000", "Receivables", AccountType::ASSET, "current_asset", "100000"),
        systemAccount("120001", "Accounts Receivable", AccountType::ASSET, "current_asset", "120000", "ACCOUNTS_RECEIVABLE"),
        header("150000", "Fixed Assets", AccountType::ASSET, "fixed_asset", "100000"),
        systemAccount("150001", "Property and Equipment", AccountType::ASSET, "fixed_asset", "150000", "FIXED_ASSETS"),
        systemAccount("159001", "Accumulated Depreciation", AccountType::ASSET, "fixed_asset", "150000", "ACCUMULATED_DEPRECIATION"),

        // Обязательства
        header("200000", "Liabilities", AccountType::LIABILITY, "current_liability"),
        header("210000", "Payables", AccountType::LIABILITY, "current_liability", "200000"),
        systemAccount("210001", "Accounts Payable", AccountType::LIABILITY, "current_liability", "210000", "ACCOUNTS_PAYABLE"),
        header("230000", "Tax Liabilities", AccountType::LIABILITY, "current_liability", "200000"),
        systemAccount("230001", "VAT Payable", AccountType::LIABILITY, "current_liability", "230000", "VAT_PAYABLE"),
        systemAccount("230002", "PAYE Payable", AccountType::LIABILITY, "current_liability", "230000", "PAYE_PAYABLE"),
        systemAccount("230003", "NSSF Payable", AccountType::LIABILITY, "current_liability", "230000", "NSSF_PAYABLE"),

        // Капитал
        header("300000", "Equity", AccountType::EQUITY, "share_capital"),
        systemAccount("310001", "Share Capital", AccountType::EQUITY, "share_capital", "300000", "SHARE_CAPITAL"),
        systemAccount("320001", "Retained Earnings", AccountType::EQUITY, "retained_earnings", "300000", "RETAINED_EARNINGS"),
        systemAccount("320002", "Current Year Earnings", AccountType::EQUITY, "retained_earnings", "300000", "CURRENT_YEAR_EARNINGS"),

        // Доходы
        header("400000", "Revenue", AccountType::REVENUE, "operating_revenue"),
        systemAccount("410001", "Sales Revenue", AccountType::REVENUE, "operating_revenue", "400000", "SALES_REVENUE"),
        systemAccount("410002", "Service Revenue", AccountType::REVENUE, "operating_revenue", "400000", "SERVICE_REVENUE"),
        systemAccount("420001", "Interest Income", AccountType::REVENUE, "non_operating_revenue", "400000", "INTEREST_INCOME"),
        systemAccount("430001", "Other Income", AccountType::REVENUE, "other_income", "400000", "OTHER_INCOME"),

        // Расходы
        header("500000", "Expenses", AccountType::EXPENSE, "operating_expense"),
        systemAccount("510001", "Cost of Goods Sold", AccountType::EXPENSE, "cost_of_sales", "500000", "COST_OF_GOODS_SOLD"),
        header("520000", "Operating Expenses", AccountType::EXPENSE, "operating_expense", "500000"),
        systemAccount("520001", "Salaries and Wages", AccountType::EXPENSE, "operating_expense", "520000", "SALARIES_EXPENSE"),
        systemAccount("520002", "Rent Expense", AccountType::EXPENSE, "operating_expense", "520000", "RENT_EXPENSE"),
        systemAccount("520003", "Utilities Expense", AccountType::EXPENSE, "operating_expense", "520000", "UTILITIES_EXPENSE"),
        systemAccount("530001", "Depreciation Expense", AccountType::EXPENSE, "operating_expense", "500000", "DEPRECIATION_EXPENSE"),
        header("540000", "Financial Expenses", AccountType::EXPENSE, "financial_expense", "500000"),
        systemAccount("540001", "Bank Charges", AccountType::EXPENSE, "financial_expense", "540000", "BANK_CHARGES"),
        systemAccount("540002", "Interest Expense", AccountType::EXPENSE, "financial_expense", "540000", "INTEREST_EXPENSE"),
    };
    return chart;
}

} // namespace ledger::application
