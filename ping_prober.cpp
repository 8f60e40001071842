#include "ping_prober.hpp"

#include "command_output.hpp"
#include "str.hpp"
#include "thread_context.hpp"
#include "uptimeping_metrics.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <numeric>
#include <regex>
#include <stdexcept>

double round_to(double x, int places) {
    auto p = std::pow(10.0, places);
    return std::round(x * p) / p;
}

bool probe_address_acceptable(std::string_view address) {
    if (address.empty() || address.front() == '-') { return false; }
    for (auto c : address) {
        if (static_cast<unsigned char>(c) <= ' ') { return false; }
    }
    return true;
}

probe_result probe_result_unreachable(int packets_sent) {
    probe_result result;
    result.packets_sent = packets_sent;
    return result;
}

probe_result probe_result_from_rtts(std::vector<double> const &rtts, int packets_sent, std::optional<double> reported_loss) {
    if (rtts.empty()) { return probe_result_unreachable(packets_sent); }

    auto mean = std::accumulate(rtts.begin(), rtts.end(), 0.0) / rtts.size();
    double jitter = 0.0;
    if (rtts.size() > 1) {
        double squares = 0;
        for (auto rtt : rtts) { squares += (rtt - mean) * (rtt - mean); }
        jitter = std::sqrt(squares / (rtts.size() - 1));
    }

    probe_result result;
    result.reachable = true;
    result.latency = round_to(mean, 2);
    result.jitter = round_to(jitter, 2);
    result.packet_loss = reported_loss ? *reported_loss : 0.0;
    result.packets_sent = packets_sent;
    result.packets_received = static_cast<int>(rtts.size());
    return result;
}

namespace {
std::optional<double> parse_number(std::string const &s) {
    char *end = nullptr;
    auto value = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end || !std::isfinite(value)) { return std::nullopt; }
    return value;
}
} // namespace

ping_output ping_output_parse(std::string_view output) {
    static const std::regex rtt_regex{R"(time[=<]([0-9.]+)\s*ms)"};
    static const std::regex loss_regex{R"(([0-9.]+)% packet loss)"};

    ping_output parsed;
    auto text = std::string{output};
    for (auto i = std::sregex_iterator(text.begin(), text.end(), rtt_regex); i != std::sregex_iterator(); ++i) {
        if (auto rtt = parse_number((*i)[1].str())) { parsed.ping_rtts.push_back(*rtt); }
    }
    std::smatch loss_match;
    if (std::regex_search(text, loss_match, loss_regex)) {
        if (auto loss = parse_number(loss_match[1].str()); loss && *loss >= 0 && *loss <= 100) { parsed.ping_reported_loss = *loss; }
    }
    return parsed;
}

probe_result ping_prober::probe(std::string const &address) {
    add_thread_context _("probe_address", address);
    if (!probe_address_acceptable(address)) {
        ++uptimeping_metric().probe_unreachable;
        return probe_result_unreachable(probe_packets_sent());
    }
    try {
        auto result = probe_attempts(address);
        if (!result.reachable) { ++uptimeping_metric().probe_unreachable; }
        return result;
    } catch (std::exception const &e) {
        std::cerr << "ping_prober::probe " << address << " failed: " << e.what() << std::endl;
        ++uptimeping_metric().probe_unreachable;
        return probe_result_unreachable(probe_packets_sent());
    }
}

ping_command_prober::ping_command_prober(uptimeping_config const &config)
    : ping_command(config.ping_command), ping_count(config.ping_count), ping_timeout_seconds(config.ping_timeout_seconds),
      probe_budget_seconds(config.probe_budget_seconds()) {}

std::vector<std::string> ping_command_prober::ping_command_argv(std::string const &address) const {
    return {ping_command, "-n", "-c", str(ping_count), "-W", str(ping_timeout_seconds), address};
}

probe_result ping_command_prober::probe_attempts(std::string const &address) {
    if (!probe_address_acceptable(address)) { throw std::invalid_argument(str("ping_command_prober refusing address '", address, "'")); }
    auto output = command_output_with_deadline(ping_command_argv(address), probe_budget_seconds);
    if (!output) {
        ++uptimeping_metric().probe_command_timeouts;
        return probe_result_unreachable(ping_count);
    }
    auto parsed = ping_output_parse(*output);
    return probe_result_from_rtts(parsed.ping_rtts, ping_count, parsed.ping_reported_loss);
}

std::unique_ptr<ping_prober> ping_prober_from_config(uptimeping_config const &config) {
    if (config.probe_method == "ping_command") { return std::make_unique<ping_command_prober>(config); }
    if (config.probe_method == "icmp_pcap") { return icmp_pcap_prober_create(config); }
    throw std::invalid_argument(str("ping_prober_from_config unknown uptimeping_probe_method ", config.probe_method));
}
