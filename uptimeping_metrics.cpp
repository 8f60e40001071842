#include "uptimeping_metrics.hpp"

uptimeping_metrics_struct &uptimeping_metric() {
    static uptimeping_metrics_struct metrics;
    return metrics;
}

void uptimeping_metrics_report_delta(std::ostream &os, uptimeping_metrics_struct const &current, uptimeping_metrics_struct const &previous) {
    uptimeping_metrics_struct::metrics_walk([&](std::string_view field_name, auto &&field_accessor) {
        auto field_delta = field_accessor(current) - field_accessor(previous);
        if (field_delta) {
            os << "uptimeping_metrics_report_delta " << field_name << " " << field_delta << std::endl;
        }
    });
}
