#include <svcExchange/svcExchange.hpp>

using namespace svcExchange;

// Stand-in for the kernel side of the two syscalls used below. On target,
// these are svc traps and the kernel reads/writes the .svcexchange section.
namespace fake_kernel {

uapi::status sys_log(usize length) {
    // Kernel reads `length` bytes of the area and prints them
    u8 line[config::exchange_area_len + 1] = {};
    exchange::area area;
    if (area.copy_vec_from(line, length) != uapi::status::ok) {
        return uapi::status::invalid;
    }
    platform::log(reinterpret_cast<const char*>(line));
    return uapi::status::ok;
}

uapi::status sys_shm_get_infos(u32 handle) {
    // Kernel populates the record in the area
    const uapi::shm_info info{handle, 0x2AU, 0x20010000U, 256U, 0x3U};
    exchange::area area;
    return area.copy_to(&info);
}

} // namespace fake_kernel

// Stage a string in the area, then ask the kernel to print it
uapi::status println(const char* msg) {
    exchange::area area;
    usize length = 0;
    while (msg[length] != '\0' && length < area.area_length()) { ++length; }

    const auto status = area.copy_vec_to(reinterpret_cast<const u8*>(msg), length);
    if (status != uapi::status::ok) {
        return status;
    }
    return fake_kernel::sys_log(length);
}

// Ask the kernel for a shm descriptor and read it back from the area
uapi::status get_shm_infos(u32 handle, uapi::shm_info& out) {
    const auto status = fake_kernel::sys_shm_get_infos(handle);
    if (status != uapi::status::ok) {
        return status;
    }
    exchange::area area;
    return area.copy_from(&out);
}

int main() {
    if (!svcExchange::initialize()) {
        return 1;
    }

    if (println("hello from the exchange area") != uapi::status::ok) {
        return 1;
    }

    uapi::shm_info info{};
    const uapi::status shm_status = get_shm_infos(2U, info);
    platform::log(uapi::to_string(shm_status));
    if (shm_status != uapi::status::ok) {
        return 1;
    }
    platform::logf("shm %u: label=%u len=%u perms=%u",
                   info.handle, info.label, static_cast<u32>(info.len), info.perms);

    const auto& stats = diagnostics::get_global_transfer_stats();
    platform::logf("transfers: writes=%u reads=%u refused=%u clipped=%u",
                   stats.writes, stats.reads, stats.refused, stats.clipped);
    return 0;
}
