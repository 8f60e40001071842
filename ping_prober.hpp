#pragma once

#include "uptimeping_config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct probe_result {
    bool reachable = false;
    std::optional<double> latency;  // ms, mean round trip
    double packet_loss = 100.0;     // percent
    std::optional<double> jitter;   // ms, sample standard deviation of round trips
    int packets_sent = 0;
    int packets_received = 0;
};

probe_result probe_result_unreachable(int packets_sent);

// reported_loss is the percentage the probe tool printed, if any
probe_result probe_result_from_rtts(std::vector<double> const &rtts, int packets_sent, std::optional<double> reported_loss = std::nullopt);

struct ping_output {
    std::vector<double> ping_rtts;
    std::optional<double> ping_reported_loss;
};

// understands iputils and busybox style "time=1.23 ms" replies and "20% packet loss" summaries
ping_output ping_output_parse(std::string_view output);

double round_to(double x, int places);

// false for addresses a probe tool could mistake for an option or split into several arguments
[[nodiscard]] bool probe_address_acceptable(std::string_view address);

class ping_prober {
  public:
    ping_prober() = default;
    ping_prober(ping_prober const &) = delete;
    ping_prober &operator=(ping_prober const &) = delete;
    virtual ~ping_prober() = default;

    // never throws; every failure, an unacceptable address included, is an unreachable result
    probe_result probe(std::string const &address);

    [[nodiscard]] virtual int probe_packets_sent() const = 0;

  protected:
    virtual probe_result probe_attempts(std::string const &address) = 0;
};

class ping_command_prober : public ping_prober {
  public:
    explicit ping_command_prober(uptimeping_config const &config);

    [[nodiscard]] int probe_packets_sent() const override { return ping_count; }
    [[nodiscard]] std::vector<std::string> ping_command_argv(std::string const &address) const;

  protected:
    probe_result probe_attempts(std::string const &address) override;

  private:
    std::string ping_command;
    int ping_count;
    double ping_timeout_seconds;
    double probe_budget_seconds;
};

std::unique_ptr<ping_prober> icmp_pcap_prober_create(uptimeping_config const &config);

// picks the implementation named by uptimeping_probe_method
std::unique_ptr<ping_prober> ping_prober_from_config(uptimeping_config const &config);
