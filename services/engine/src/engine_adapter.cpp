#include "../include/engine_adapter.hpp"

const char* job_type_name(JobType type) {
    switch (type) {
        case JobType::compress: return "compress";
        case JobType::decompress: return "decompress";
        case JobType::verify: return "verify";
        case JobType::compress_data: return "compress_data";
        case JobType::decompress_data: return "decompress_data";
    }
    return "compress";
}

std::optional<JobType> job_type_from_name(const std::string& name) {
    for (auto t : {JobType::compress, JobType::decompress, JobType::verify,
                   JobType::compress_data, JobType::decompress_data}) {
        if (name == job_type_name(t)) return t;
    }
    return std::nullopt;
}

bool is_data_job(JobType type) {
    return type == JobType::compress_data || type == JobType::decompress_data;
}
