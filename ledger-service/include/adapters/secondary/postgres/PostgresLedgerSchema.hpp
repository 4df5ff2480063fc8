#pragma once

namespace ledger::adapters::secondary {

/**
 * @brief Схема журнала
 *
 * Суммы - BIGINT в минорных единицах.
 * Проводки и строки нельзя удалить, строки нельзя изменить (триггеры).
 * Частичный уникальный индекс не даёт двух активных проводок одного источника.
 */
inline const char* LEDGER_SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS accounts (
        id BIGSERIAL PRIMARY KEY,
        code VARCHAR(32) NOT NULL UNIQUE,
        name VARCHAR(255) NOT NULL,
        type VARCHAR(16) NOT NULL CHECK (type IN ('ASSET','LIABILITY','EQUITY','REVENUE','EXPENSE')),
        parent_id BIGINT REFERENCES accounts(id),
        is_header BOOLEAN NOT NULL DEFAULT FALSE,
        is_active BOOLEAN NOT NULL DEFAULT TRUE,
        current_balance BIGINT NOT NULL DEFAULT 0,
        balance_updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
    );

    CREATE TABLE IF NOT EXISTS journal_sequences (
        prefix VARCHAR(10) PRIMARY KEY,
        last_value BIGINT NOT NULL DEFAULT 0,
        updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
    );

    CREATE TABLE IF NOT EXISTS journal_entries (
        id BIGSERIAL PRIMARY KEY,
        entry_number VARCHAR(32) NOT NULL UNIQUE,
        source_type VARCHAR(16) NOT NULL,
        source_id BIGINT,
        reference VARCHAR(128) NOT NULL DEFAULT '',
        entry_date DATE NOT NULL,
        description TEXT NOT NULL,
        status VARCHAR(10) NOT NULL CHECK (status IN ('DRAFT','POSTED','REVERSED')),
        total_debit BIGINT NOT NULL CHECK (total_debit >= 0),
        total_credit BIGINT NOT NULL CHECK (total_credit >= 0),
        created_by VARCHAR(128) NOT NULL DEFAULT '',
        created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        posted_at TIMESTAMPTZ,
        reversal_of_id BIGINT REFERENCES journal_entries(id),
        reversed_by_id BIGINT REFERENCES journal_entries(id),
        reversal_reason TEXT NOT NULL DEFAULT ''
    );

    CREATE UNIQUE INDEX IF NOT EXISTS ux_journal_entries_active_source
        ON journal_entries (source_type, source_id)
        WHERE source_id IS NOT NULL AND status <> 'REVERSED';

    CREATE INDEX IF NOT EXISTS ix_journal_entries_date ON journal_entries (entry_date, id);

    CREATE TABLE IF NOT EXISTS journal_lines (
        id BIGSERIAL PRIMARY KEY,
        journal_entry_id BIGINT NOT NULL REFERENCES journal_entries(id),
        line_number INT NOT NULL,
        account_id BIGINT NOT NULL REFERENCES accounts(id),
        description TEXT NOT NULL DEFAULT '',
        debit_amount BIGINT NOT NULL DEFAULT 0 CHECK (debit_amount >= 0),
        credit_amount BIGINT NOT NULL DEFAULT 0 CHECK (credit_amount >= 0),
        UNIQUE (journal_entry_id, line_number)
    );

    CREATE INDEX IF NOT EXISTS ix_journal_lines_account ON journal_lines (account_id);

    CREATE TABLE IF NOT EXISTS journal_dead_letters (
        id BIGSERIAL PRIMARY KEY,
        task_name VARCHAR(64) NOT NULL,
        payload TEXT NOT NULL,
        last_error TEXT NOT NULL,
        attempts INT NOT NULL,
        failed_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
    );

    CREATE OR REPLACE FUNCTION ledger_forbid_change() RETURNS trigger AS $$
    BEGIN
        RAISE EXCEPTION 'ledger history is immutable: % on %', TG_OP, TG_TABLE_NAME;
    END;
    $$ LANGUAGE plpgsql;

    CREATE OR REPLACE FUNCTION ledger_guard_entry_update() RETURNS trigger AS $$
    BEGIN
        IF NEW.total_debit <> OLD.total_debit OR NEW.total_credit <> OLD.total_credit
           OR NEW.entry_number <> OLD.entry_number THEN
            RAISE EXCEPTION 'journal entry % amounts are immutable', OLD.entry_number;
        END IF;
        IF NOT ((OLD.status = 'DRAFT' AND NEW.status = 'POSTED')
             OR (OLD.status = 'POSTED' AND NEW.status = 'REVERSED')) THEN
            RAISE EXCEPTION 'illegal status transition % -> % for %', OLD.status, NEW.status, OLD.entry_number;
        END IF;
        RETURN NEW;
    END;
    $$ LANGUAGE plpgsql;

    DROP TRIGGER IF EXISTS trg_journal_entries_no_delete ON journal_entries;
    CREATE TRIGGER trg_journal_entries_no_delete BEFORE DELETE ON journal_entries
        FOR EACH ROW EXECUTE FUNCTION ledger_forbid_change();

    DROP TRIGGER IF EXISTS trg_journal_entries_guard ON journal_entries;
    CREATE TRIGGER trg_journal_entries_guard BEFORE UPDATE ON journal_entries
        FOR EACH ROW EXECUTE FUNCTION ledger_guard_entry_update();

    DROP TRIGGER IF EXISTS trg_journal_lines_immutable ON journal_lines;
    CREATE TRIGGER trg_journal_lines_immutable BEFORE UPDATE OR DELETE ON journal_lines
        FOR EACH ROW EXECUTE FUNCTION ledger_forbid_change();

    INSERT INTO accounts (code, name, type) VALUES
        ('1101', 'Cash', 'ASSET'),
        ('1102', 'Bank', 'ASSET'),
        ('1201', 'Accounts receivable', 'ASSET'),
        ('1240', 'Input VAT', 'ASSET'),
        ('1250', 'Prepaid income tax', 'ASSET'),
        ('1301', 'Inventory', 'ASSET'),
        ('2101', 'Accounts payable', 'LIABILITY'),
        ('2103', 'Output VAT', 'LIABILITY'),
        ('2111', 'Withholding tax art.21 payable', 'LIABILITY'),
        ('2112', 'Withholding tax art.23 payable', 'LIABILITY'),
        ('3101', 'Share capital', 'EQUITY'),
        ('4101', 'Sales revenue', 'REVENUE'),
        ('5101', 'Cost of goods sold', 'EXPENSE'),
        ('6101', 'Operating expenses', 'EXPENSE')
    ON CONFLICT (code) DO NOTHING;
)";

} // namespace ledger::adapters::secondary
