#include "../../include/report_renderer.hpp"
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace shrink {

namespace {

constexpr double kKiB = 1024.0;

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string unit_label(const HumanSize& size, const LanguagePack& lang) {
    return lang.format("units." + std::string(size.unit));
}

std::int64_t signed_delta(std::uintmax_t before, std::uintmax_t after) {
    return static_cast<std::int64_t>(before) - static_cast<std::int64_t>(after);
}

// "{size:.2f} {unit}" arguments for a byte count
void push_size(MessageArgs& args, const std::string& value_name, const std::string& unit_name,
               double bytes, const LanguagePack& lang) {
    const HumanSize size = human_size(bytes);
    args.emplace_back(value_name, size.value);
    args.emplace_back(unit_name, unit_label(size, lang));
}

void write_row(std::ostringstream& out, std::initializer_list<std::string> fields) {
    bool first = true;
    for (const auto& f : fields) {
        if (!first) out << ',';
        out << csv_escape(f);
        first = false;
    }
    out << '\n';
}

std::string_view failure_key(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::BackupFailure: return "error.backup";
        case FailureKind::UnsupportedFormat: return "error.unsupported";
        case FailureKind::DecodeFailure: return "error.decode";
        case FailureKind::EncodeFailure: return "error.encode";
    }
    return "error.encode";
}

} // namespace

HumanSize human_size(const double bytes) noexcept {
    const double magnitude = std::fabs(bytes);
    if (magnitude >= kKiB * kKiB * kKiB) return {bytes / (kKiB * kKiB * kKiB), "GB"};
    if (magnitude >= kKiB * kKiB) return {bytes / (kKiB * kKiB), "MB"};
    return {bytes / kKiB, "KB"};
}

std::optional<double> percent_saved(const std::uintmax_t before, const std::uintmax_t after) noexcept {
    if (before == 0) return std::nullopt;
    return 100.0 * (static_cast<double>(before) - static_cast<double>(after)) / static_cast<double>(before);
}

std::optional<double> average_seconds(const AggregateSnapshot& snapshot) noexcept {
    if (snapshot.compressed_count == 0) return std::nullopt;
    return snapshot.compressed_seconds_total / static_cast<double>(snapshot.compressed_count);
}

std::string format_duration(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    const auto hours = static_cast<long long>(seconds / 3600.0);
    seconds -= static_cast<double>(hours) * 3600.0;
    const auto minutes = static_cast<int>(seconds / 60.0);
    seconds -= minutes * 60.0;

    std::ostringstream oss;
    oss << hours << ':'
        << std::setw(2) << std::setfill('0') << minutes << ':'
        << std::setw(5) << std::setfill('0') << std::fixed << std::setprecision(2) << seconds;
    return oss.str();
}

std::string format_timestamp(const AggregateSnapshot::Clock::time_point when, const char* pattern) {
    const std::time_t t = AggregateSnapshot::Clock::to_time_t(when);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, pattern);
    return oss.str();
}

std::string csv_escape(const std::string_view data) {
    if (data.find_first_of(",\"\n\r") == std::string_view::npos) {
        return std::string(data);
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"');
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::string status_label(const Status status, const LanguagePack& lang) {
    switch (status) {
        case Status::Compressed: return lang.format("status.compressed");
        case Status::SkippedBackedUp: return lang.format("status.skipped_backup");
        case Status::SkippedByName: return lang.format("status.skipped_named");
        case Status::Unreadable: return lang.format("status.unreadable");
        case Status::CompressionError: return lang.format("status.compression_error");
    }
    return lang.format("status.compression_error");
}

std::string render_failures(const FileRecord& record, const LanguagePack& lang) {
    std::string out;
    for (const auto& failure : record.errors) {
        if (!out.empty()) out += "; ";
        out += lang.format(failure_key(failure.kind), {{"detail", failure.detail}});
    }
    return out;
}

std::string render_progress_line(const FileRecord& record, const LanguagePack& lang) {
    MessageArgs args{
        {"status", status_label(record.status, lang)},
        {"path", record.path.string()},
    };

    std::string line;
    switch (record.status) {
        case Status::Compressed: {
            const std::uintmax_t after = record.size_after.value_or(record.size_before);
            push_size(args, "before", "before_unit", static_cast<double>(record.size_before), lang);
            push_size(args, "after", "after_unit", static_cast<double>(after), lang);
            args.emplace_back("percent", percent_saved(record.size_before, after).value_or(0.0));
            line = lang.format("progress.size_change", args);
            break;
        }
        case Status::SkippedBackedUp:
        case Status::SkippedByName:
            line = lang.format("progress.status_only", args);
            break;
        case Status::Unreadable:
        case Status::CompressionError:
            args.emplace_back("error", render_failures(record, lang));
            return lang.format("progress.failed", args);
    }

    // a backup failure does not prevent compression, but it must still be visible
    if (record.has_error()) {
        line = lang.format("progress.with_warning", {{"line", line}, {"error", render_failures(record, lang)}});
    }
    return line;
}

std::string render_console(const AggregateSnapshot& snapshot, const LanguagePack& lang) {
    std::ostringstream out;
    const auto count = [](std::size_t n) {
        return MessageArgs{{"count", static_cast<std::uint64_t>(n)}};
    };

    out << '\n' << lang.format("report.header_summary") << '\n';
    out << lang.format("report.start_time", {{"time", format_timestamp(snapshot.start_time)}}) << '\n';
    out << lang.format("report.end_time", {{"time", format_timestamp(snapshot.end_time)}}) << '\n';
    const std::chrono::duration<double> elapsed = snapshot.end_time - snapshot.start_time;
    out << lang.format("report.elapsed", {{"elapsed", format_duration(elapsed.count())}}) << '\n';

    if (const auto avg = average_seconds(snapshot)) {
        out << lang.format("report.avg_time", {{"seconds", *avg}}) << '\n';
    } else {
        out << lang.format("report.no_avg_time") << '\n';
    }

    out << lang.format("report.total_images", count(snapshot.total)) << '\n';
    out << lang.format("report.compressed_success", count(snapshot.compressed_count)) << '\n';
    out << lang.format("report.skipped_backup", count(snapshot.skipped_backup_count)) << '\n';
    out << lang.format("report.skipped_named", count(snapshot.skipped_named_count)) << '\n';
    out << lang.format("report.error_unreadable", count(snapshot.unreadable_count)) << '\n';
    out << lang.format("report.error_failed", count(snapshot.error_count)) << '\n';

    MessageArgs before_args;
    push_size(before_args, "size", "unit", static_cast<double>(snapshot.bytes_before_total), lang);
    out << lang.format("report.size_before", before_args) << '\n';

    MessageArgs after_args;
    push_size(after_args, "size", "unit", static_cast<double>(snapshot.bytes_after_total), lang);
    out << lang.format("report.size_after", after_args) << '\n';

    if (const auto pct = percent_saved(snapshot.bytes_before_total, snapshot.bytes_after_total)) {
        MessageArgs saved_args;
        push_size(saved_args, "size", "unit",
                  static_cast<double>(signed_delta(snapshot.bytes_before_total, snapshot.bytes_after_total)), lang);
        saved_args.emplace_back("percent", *pct);
        out << lang.format("report.size_saved", saved_args) << '\n';
    } else {
        out << lang.format("report.size_saved_unavailable") << '\n';
    }

    out << '\n' << lang.format("report.header_ext_summary") << '\n';
    for (const auto& ext : snapshot.extensions) {
        MessageArgs args{
            {"ext", ext.extension},
            {"count", static_cast<std::uint64_t>(ext.count)},
        };
        push_size(args, "savings", "unit",
                  static_cast<double>(signed_delta(ext.bytes_before, ext.bytes_after)), lang);
        args.emplace_back("percent", percent_saved(ext.bytes_before, ext.bytes_after).value_or(0.0));
        out << lang.format("report.ext_format", args) << '\n';
    }
    return out.str();
}

std::string render_csv(const AggregateSnapshot& snapshot, const LanguagePack& lang) {
    std::ostringstream out;
    const std::string unavailable = lang.format("csv.unavailable");
    const auto f = [&lang](const char* key) { return lang.format(key); };

    // summary
    out << csv_escape(f("csv.section_summary")) << '\n';
    write_row(out, {f("csv.fields.key"), f("csv.fields.value")});

    const std::chrono::duration<double> elapsed = snapshot.end_time - snapshot.start_time;
    const auto avg = average_seconds(snapshot);
    const auto pct = percent_saved(snapshot.bytes_before_total, snapshot.bytes_after_total);

    write_row(out, {f("csv.fields.start_time"), format_timestamp(snapshot.start_time)});
    write_row(out, {f("csv.fields.end_time"), format_timestamp(snapshot.end_time)});
    write_row(out, {f("csv.fields.elapsed"), format_duration(elapsed.count())});
    write_row(out, {f("csv.fields.avg_time"), avg ? fixed(*avg, 3) : unavailable});
    write_row(out, {f("csv.fields.total_images"), std::to_string(snapshot.total)});
    write_row(out, {f("csv.fields.compressed"), std::to_string(snapshot.compressed_count)});
    write_row(out, {f("csv.fields.skipped_backup"), std::to_string(snapshot.skipped_backup_count)});
    write_row(out, {f("csv.fields.skipped_named"), std::to_string(snapshot.skipped_named_count)});
    write_row(out, {f("csv.fields.unreadable"), std::to_string(snapshot.unreadable_count)});
    write_row(out, {f("csv.fields.errors"), std::to_string(snapshot.error_count)});
    write_row(out, {f("csv.fields.size_before"), std::to_string(snapshot.bytes_before_total)});
    write_row(out, {f("csv.fields.size_after"), std::to_string(snapshot.bytes_after_total)});
    write_row(out, {f("csv.fields.size_saved"),
                    std::to_string(signed_delta(snapshot.bytes_before_total, snapshot.bytes_after_total))});
    write_row(out, {f("csv.fields.size_percent"), pct ? fixed(*pct, 1) : unavailable});
    out << '\n';

    // per extension
    out << csv_escape(f("csv.section_ext")) << '\n';
    write_row(out, {f("csv.fields.ext"), f("csv.fields.ext_count"), f("csv.fields.ext_before"),
                    f("csv.fields.ext_after"), f("csv.fields.ext_saved"), f("csv.fields.ext_percent")});
    for (const auto& ext : snapshot.extensions) {
        const auto ext_pct = percent_saved(ext.bytes_before, ext.bytes_after);
        write_row(out, {ext.extension,
                        std::to_string(ext.count),
                        std::to_string(ext.bytes_before),
                        std::to_string(ext.bytes_after),
                        std::to_string(signed_delta(ext.bytes_before, ext.bytes_after)),
                        ext_pct ? fixed(*ext_pct, 1) : unavailable});
    }
    out << '\n';

    // per file
    out << csv_escape(f("csv.section_detail")) << '\n';
    write_row(out, {f("csv.fields.detail_path"), f("csv.fields.detail_ext"), f("csv.fields.detail_before"),
                    f("csv.fields.detail_after"), f("csv.fields.detail_percent"), f("csv.fields.detail_status"),
                    f("csv.fields.detail_time"), f("csv.fields.detail_error")});
    for (const auto& r : snapshot.records) {
        std::string after;
        std::string percent;
        if (r.size_after) {
            after = std::to_string(*r.size_after);
            const auto file_pct = percent_saved(r.size_before, *r.size_after);
            percent = file_pct ? fixed(*file_pct, 1) : unavailable;
        }
        write_row(out, {r.path.string(),
                        r.extension,
                        std::to_string(r.size_before),
                        after,
                        percent,
                        status_label(r.status, lang),
                        fixed(r.elapsed_seconds, 3),
                        render_failures(r, lang)});
    }
    return out.str();
}

std::filesystem::path write_csv_report(const AggregateSnapshot& snapshot,
                                       const LanguagePack& lang,
                                       const std::filesystem::path& folder,
                                       const std::string& filename) {
    // render first so a missing message leaves no half-written file behind
    const std::string document = render_csv(snapshot, lang);

    const auto path = folder / (filename + "_" + format_timestamp(snapshot.end_time, "%Y-%m-%d-%H-%M-%S") + ".csv");
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open report file: " + path.string());
    }
    out << "\xEF\xBB\xBF" << document;
    out.flush();
    if (!out) {
        throw std::runtime_error("cannot write report file: " + path.string());
    }
    return path;
}

} // namespace shrink
