// src/monitor/option_scanner.cpp

#include "optwatch/monitor/option_scanner.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include "optwatch/classify/strike_window.hpp"
#include "optwatch/core/logger.hpp"
#include "optwatch/core/time_utils.hpp"
#include "optwatch/marketdata/snapshot_reader.hpp"
#include "optwatch/options/option_code_parser.hpp"
#include "optwatch/scheduling/sliced_sleep.hpp"

namespace optwatch {

OptionScanner::OptionScanner(MarketConfig market, ScannerConfig settings, RetryPolicy retry,
                             ScannerDependencies deps, NowSupplier now)
    : market_(std::move(market)),
      settings_(std::move(settings)),
      retry_(std::move(retry)),
      deps_(std::move(deps)),
      now_(std::move(now)) {
    if (!deps_.client || !deps_.tracker || !deps_.classifier || !deps_.calendar) {
        throw std::invalid_argument("OptionScanner requires client, tracker, classifier and calendar");
    }
    if (!now_) {
        now_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string OptionScanner::display_name(const std::string& code) const {
    auto it = market_.names.find(code);
    return it != market_.names.end() ? it->second : code;
}

bool OptionScanner::pace(const std::atomic<bool>* running) const {
    return sleep_while_running(settings_.api_pacing, running);
}

std::unordered_map<std::string, UnderlyingQuote> OptionScanner::fetch_underlying_quotes(
    const Timestamp& now) {
    std::unordered_map<std::string, UnderlyingQuote> live;

    auto table = invoke_with_retry(
        [&] { return deps_.client->get_market_snapshot(market_.underlyings); }, retry_,
        "Underlying snapshot " + market_to_string(market_.market));
    if (table.is_ok()) {
        auto quotes = SnapshotReader::read_underlying_quotes(table.value(), now);
        if (quotes.is_error()) {
            WARN("Unreadable underlying snapshot: " << quotes.error()->what());
        } else {
            for (const auto& quote : quotes.value()) {
                if (quote.last_price > 0.0) {
                    live[quote.code] = quote;
                }
            }
        }
    }

    std::unordered_map<std::string, UnderlyingQuote> result;
    for (const auto& code : market_.underlyings) {
        auto it = live.find(code);
        if (it != live.end()) {
            UnderlyingQuote quote = it->second;
            if (quote.name.empty()) {
                quote.name = display_name(code);
            }
            price_cache_[code] = quote;
            if (deps_.store) {
                auto saved = deps_.store->save_underlying_quote(market_.market, quote);
                if (saved.is_error()) {
                    WARN("Failed to persist quote of " << code << ": " << saved.error()->what());
                }
            }
            result[code] = quote;
            continue;
        }

        auto cached = price_cache_.find(code);
        if (cached != price_cache_.end() && now - cached->second.observed_at <= settings_.price_cache_ttl) {
            DEBUG("Using cached price " << cached->second.last_price << " for " << code);
            result[code] = cached->second;
            continue;
        }

        auto fallback = market_.default_prices.find(code);
        if (fallback != market_.default_prices.end()) {
            WARN("No live quote for " << code << ", using default price " << fallback->second);
            UnderlyingQuote quote;
            quote.code = code;
            quote.name = display_name(code);
            quote.last_price = fallback->second;
            quote.observed_at = now;
            quote.from_fallback = true;
            result[code] = quote;
            continue;
        }

        WARN("No price available for " << code << ", skipping it this scan");
    }

    return result;
}

std::vector<std::string> OptionScanner::select_expiries(const std::vector<std::string>& expiries,
                                                        const Timestamp& now) const {
    const std::tm local = deps_.calendar->local_time(now);
    const long today = core::days_from_civil(local.tm_year + 1900,
                                             static_cast<unsigned>(local.tm_mon + 1),
                                             static_cast<unsigned>(local.tm_mday));

    std::vector<std::string> selected;
    for (const auto& expiry : expiries) {
        long days = 0;
        if (!core::parse_date_days(expiry, days)) {
            DEBUG("Ignoring unparsable expiry " << expiry);
            continue;
        }
        if (days >= today && days <= today + settings_.expiry_window_days) {
            selected.push_back(expiry);
        }
    }

    if (selected.empty()) {
        const size_t count = std::min(settings_.fallback_expiry_count, expiries.size());
        selected.assign(expiries.begin(), expiries.begin() + static_cast<long>(count));
    }
    return selected;
}

std::vector<std::string> OptionScanner::collect_option_codes(const UnderlyingQuote& quote,
                                                             const Timestamp& now,
                                                             const std::atomic<bool>* running) {
    std::vector<std::string> codes;

    auto expiry_table = invoke_with_retry(
        [&] { return deps_.client->get_expiration_dates(quote.code); }, retry_,
        "Expiration dates " + quote.code);
    if (expiry_table.is_error()) {
        return codes;
    }
    auto expiries = SnapshotReader::read_expiration_dates(expiry_table.value());
    if (expiries.is_error()) {
        WARN("Unreadable expiration dates for " << quote.code << ": "
                                                << expiries.error()->what());
        return codes;
    }

    const std::vector<std::string> selected = select_expiries(expiries.value(), now);
    INFO(quote.code << ": " << expiries.value().size() << " expiries listed, " << selected.size()
                    << " selected");

    const ThresholdRule& rule =
        deps_.classifier->thresholds().rule_for(market_.market, quote.code);

    for (const auto& expiry : selected) {
        if (!pace(running)) {
            break;
        }

        auto chain_table = invoke_with_retry(
            [&] { return deps_.client->get_option_chain(quote.code, expiry, expiry); }, retry_,
            "Option chain " + quote.code + " " + expiry);
        if (chain_table.is_error()) {
            continue;
        }
        auto chain = SnapshotReader::read_chain(chain_table.value());
        if (chain.is_error()) {
            WARN("Unreadable option chain for " << quote.code << " " << expiry << ": "
                                                << chain.error()->what());
            continue;
        }

        StrikeSelection selection =
            StrikeWindow::select(chain.value(), quote.last_price, rule.strike_range_fraction);
        DEBUG(quote.code << " " << expiry << ": " << selection.entries.size() << " of "
                         << chain.value().size() << " strikes in [" << selection.lower << ", "
                         << selection.upper << "]" << (selection.widened ? " (widened)" : ""));
        for (const auto& entry : selection.entries) {
            codes.push_back(entry.option_code);
        }
    }

    return codes;
}

TradeEvent OptionScanner::build_event(const OptionSnapshot& snapshot,
                                      const UnderlyingQuote& quote) const {
    TradeEvent event;
    event.snapshot = snapshot;
    event.market = market_.market;
    event.underlying_price = quote.last_price;
    event.underlying_name = quote.name;

    const ParsedOptionCode parsed = OptionCodeParser::parse(snapshot.option_code);
    if (!parsed.is_valid) {
        WARN("Could not parse option code " << snapshot.option_code);
    }
    event.expiry_date = parsed.expiry_date;

    if (snapshot.api_strike_price > 0.0) {
        event.strike_price = snapshot.api_strike_price;
        if (snapshot.api_option_type == "CALL") {
            event.option_class = OptionClass::CALL;
        } else if (snapshot.api_option_type == "PUT") {
            event.option_class = OptionClass::PUT;
        } else {
            event.option_class = parsed.option_class;
        }
    } else {
        event.strike_price = parsed.strike_price;
        event.option_class = parsed.option_class;
    }

    if (event.strike_price > 0.0 && quote.last_price > 0.0) {
        event.strike_distance = event.strike_price - quote.last_price;
        event.strike_distance_pct = event.strike_distance / quote.last_price * 100.0;
    }
    return event;
}

Result<ScanReport> OptionScanner::scan(const std::atomic<bool>* running) {
    ScanReport report;
    report.market = market_.market;

    const Timestamp now = now_();
    deps_.tracker->warm_up();
    const std::string trading_day = deps_.tracker->trading_day();

    const auto quotes = fetch_underlying_quotes(now);

    std::vector<std::string> option_codes;
    std::unordered_map<std::string, std::string> underlying_of;
    std::set<std::string> seen;
    for (const auto& code : market_.underlyings) {
        if (running && !running->load()) {
            return report;
        }
        auto quote = quotes.find(code);
        if (quote == quotes.end()) {
            ++report.underlyings_skipped;
            continue;
        }

        const auto codes = collect_option_codes(quote->second, now, running);
        if (codes.empty()) {
            WARN("No option contracts selected for " << code);
            ++report.underlyings_skipped;
            continue;
        }
        ++report.underlyings_scanned;
        for (const auto& option_code : codes) {
            if (seen.insert(option_code).second) {
                option_codes.push_back(option_code);
                underlying_of[option_code] = code;
            }
        }
    }

    report.options_selected = option_codes.size();
    if (option_codes.empty()) {
        INFO("No options to snapshot in " << market_to_string(market_.market));
        return report;
    }

    auto table = invoke_with_retry(
        [&] { return deps_.client->get_market_snapshot(option_codes); }, retry_,
        "Option snapshot " + market_to_string(market_.market));
    if (table.is_error()) {
        return make_error<ScanReport>(table.error()->code(), table.error()->what(),
                                      "OptionScanner");
    }
    auto snapshots = SnapshotReader::read_option_snapshots(table.value(), now);
    if (snapshots.is_error()) {
        return make_error<ScanReport>(snapshots.error()->code(), snapshots.error()->what(),
                                      "OptionScanner");
    }
    report.options_quoted = snapshots.value().size();

    std::vector<TradeEvent> events;
    for (auto snapshot : snapshots.value()) {
        auto owner = underlying_of.find(snapshot.option_code);
        if (owner == underlying_of.end()) {
            DEBUG("Snapshot row for unrequested option " << snapshot.option_code);
            continue;
        }
        if (snapshot.volume <= 0) {
            continue;
        }
        snapshot.underlying_code = owner->second;

        TradeEvent event = build_event(snapshot, quotes.at(owner->second));
        const DeltaSet deltas = deps_.tracker->compute(snapshot);
        event.previous_volume = deltas.previous_volume;
        event.volume_delta = deltas.volume_delta;
        event.open_interest_delta = deltas.open_interest_delta;
        event.net_open_interest_delta = deltas.net_open_interest_delta;
        event.is_big_trade = deps_.classifier->classify(event);

        if (deps_.store) {
            auto saved = deps_.store->save_trade(event, trading_day);
            if (saved.is_error()) {
                ++report.persist_failures;
                ERROR("Failed to persist " << snapshot.option_code << ": "
                                           << saved.error()->what());
            } else {
                ++report.rows_persisted;
            }
        }

        deps_.tracker->record_current(snapshot.option_code, snapshot.volume,
                                      snapshot.open_interest, snapshot.net_open_interest);
        events.push_back(std::move(event));
    }

    const std::vector<TradeEvent> big_trades = deps_.classifier->select_big_trades(events);
    report.big_trades = big_trades.size();

    std::vector<TradeEvent> announce = deps_.classifier->select_notifications(big_trades, now);
    if (!announce.empty() && deps_.notifier) {
        TradeSummary summary;
        summary.market = market_.market;
        summary.generated_at = now;
        summary.trades = std::move(announce);
        summary.big_trades_seen = big_trades.size();

        auto sent = deps_.notifier->notify(summary);
        if (sent.is_error()) {
            ERROR("Notification via " << deps_.notifier->name()
                                      << " failed: " << sent.error()->what());
        } else {
            report.notified = summary.trades.size();
        }
    }

    INFO("Scan " << market_to_string(market_.market) << " finished: "
                 << report.underlyings_scanned << " underlyings, " << report.options_quoted
                 << " options quoted, " << report.rows_persisted << " persisted, "
                 << report.big_trades << " big trades, " << report.notified << " notified");
    return report;
}

}  // namespace optwatch
