#pragma once

#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

struct ProcStatFileContents {
private:
    std::string contents_;
    std::vector<std::pair<size_t, size_t>> fields_; // (offset, length) in contents_

    explicit ProcStatFileContents(std::string stat_file_contents);

public:
    // Field numbers (counted from 0) of the interesting fields in /proc/[pid]/stat
    static constexpr size_t PID_FID = 0;
    static constexpr size_t COMM_FID = 1;
    static constexpr size_t STATE_FID = 2;
    static constexpr size_t PPID_FID = 3;
    static constexpr size_t PGRP_FID = 4;
    static constexpr size_t START_TIME_FID = 21;

    ProcStatFileContents(const ProcStatFileContents&) = delete;
    ProcStatFileContents(ProcStatFileContents&&) noexcept = default;
    ProcStatFileContents& operator=(const ProcStatFileContents&) = delete;
    ProcStatFileContents& operator=(ProcStatFileContents&&) noexcept = default;

    ~ProcStatFileContents() = default;

    // Throws std::runtime_error if @p stat_file_contents is malformed
    static ProcStatFileContents from_proc_stat_contents(std::string stat_file_contents) {
        return ProcStatFileContents{std::move(stat_file_contents)};
    }

    // Returns ProcStatFileContents of /proc/@p pid/stat
    static ProcStatFileContents get(pid_t pid);

    [[nodiscard]] size_t fields_no() const noexcept { return fields_.size(); }

    // Throws std::out_of_range if field @p no does not exist
    [[nodiscard]] std::string_view field(size_t no) const {
        auto [beg, len] = fields_.at(no);
        return std::string_view{contents_}.substr(beg, len);
    }
};
