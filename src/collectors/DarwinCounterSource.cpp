#include "collectors/DarwinCounterSource.hpp"

#include <mach/mach.h>
#include <mach/mach_host.h>
#include <mach/processor_info.h>
#include <sys/types.h>
#include <sys/sysctl.h>
#include <sys/param.h>
#include <sys/mount.h>
#include <sys/socket.h>
#include <net/if.h>
#include <ifaddrs.h>

#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#include <IOKit/IOBSD.h>
#include <IOKit/storage/IOBlockStorageDriver.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <string>
#include <unordered_set>

namespace harbor::collectors {

DarwinCounterSource::DarwinCounterSource() {
  host_port_ = mach_host_self();
  size_t size = sizeof(physical_bytes_);
  if (sysctlbyname("hw.memsize", &physical_bytes_, &size, nullptr, 0) != 0) {
    std::fprintf(stderr, "harbor: DarwinCounterSource: hw.memsize unavailable\n");
    physical_bytes_ = 0;
  }
}

bool DarwinCounterSource::read_cpu(harbor::model::CpuCounters& out) {
  natural_t ncpu = 0;
  processor_info_array_t info = nullptr;
  mach_msg_type_number_t count = 0;
  kern_return_t kr = host_processor_info(host_port_, PROCESSOR_CPU_LOAD_INFO, &ncpu, &info, &count);
  if (kr != KERN_SUCCESS || info == nullptr) return false;
  auto* load = reinterpret_cast<processor_cpu_load_info_t>(info);
  out.per_core.clear();
  out.per_core.reserve(ncpu);
  for (natural_t i = 0; i < ncpu; ++i) {
    harbor::model::CpuTicks t{};
    t.user = load[i].cpu_ticks[CPU_STATE_USER];
    t.system = load[i].cpu_ticks[CPU_STATE_SYSTEM];
    t.nice = load[i].cpu_ticks[CPU_STATE_NICE];
    t.idle = load[i].cpu_ticks[CPU_STATE_IDLE];
    out.per_core.push_back(t);
  }
  vm_deallocate(mach_task_self(), reinterpret_cast<vm_address_t>(info), count * sizeof(integer_t));
  return !out.per_core.empty();
}

bool DarwinCounterSource::read_memory(harbor::model::MemoryZones& out) {
  vm_size_t page_size = 0;
  if (host_page_size(host_port_, &page_size) != KERN_SUCCESS) return false;
  vm_statistics64_data_t vm{};
  mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
  if (host_statistics64(host_port_, HOST_VM_INFO64, reinterpret_cast<host_info64_t>(&vm), &count) != KERN_SUCCESS)
    return false;
  const uint64_t ps = static_cast<uint64_t>(page_size);
  out.total_bytes = physical_bytes_;
  out.active_bytes = static_cast<uint64_t>(vm.active_count) * ps;
  out.wired_bytes = static_cast<uint64_t>(vm.wire_count) * ps;
  out.compressed_bytes = static_cast<uint64_t>(vm.compressor_page_count) * ps;
  out.inactive_bytes = static_cast<uint64_t>(vm.inactive_count) * ps;
  out.free_bytes = static_cast<uint64_t>(vm.free_count) * ps;
  return out.total_bytes > 0;
}

void DarwinCounterSource::read_volumes(std::vector<harbor::model::Volume>& out) {
  out.clear();
  struct statfs* mnts = nullptr;
  int n = getmntinfo(&mnts, MNT_NOWAIT);
  if (n <= 0) return;
  static const std::unordered_set<std::string> pseudo = {"devfs", "autofs", "nullfs", "fdesc"};
  for (int i = 0; i < n; ++i) {
    const auto& m = mnts[i];
    if (!(m.f_flags & MNT_LOCAL) || (m.f_flags & MNT_DONTBROWSE)) continue;
    if (pseudo.count(m.f_fstypename)) continue;
    harbor::model::Volume v;
    v.device = m.f_mntfromname;
    v.mountpoint = m.f_mntonname;
    v.fstype = m.f_fstypename;
    v.total_bytes = static_cast<uint64_t>(m.f_blocks) * m.f_bsize;
    v.free_bytes = static_cast<uint64_t>(m.f_bavail) * m.f_bsize;
    v.used_bytes = v.total_bytes > v.free_bytes ? v.total_bytes - v.free_bytes : 0;
    out.push_back(std::move(v));
  }
}

void DarwinCounterSource::read_interfaces(std::vector<harbor::model::NetIf>& out) {
  out.clear();
  struct ifaddrs* ifap = nullptr;
  if (getifaddrs(&ifap) != 0) return;
  for (struct ifaddrs* ifa = ifap; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_LINK) continue;
    if (ifa->ifa_flags & IFF_LOOPBACK) continue;
    if (!ifa->ifa_data) continue;
    // Physical (en*) and tunnel (utun*) links; skips awdl, bridge, anpi and similar
    if (std::strncmp(ifa->ifa_name, "en", 2) != 0 && std::strncmp(ifa->ifa_name, "utun", 4) != 0) continue;
    const auto* ifd = static_cast<const struct if_data*>(ifa->ifa_data);
    out.push_back(harbor::model::NetIf{ifa->ifa_name, ifd->ifi_ibytes, ifd->ifi_obytes});
  }
  freeifaddrs(ifap);
}

static bool dict_u64(CFDictionaryRef dict, CFStringRef key, uint64_t& out) {
  auto num = static_cast<CFNumberRef>(CFDictionaryGetValue(dict, key));
  if (!num || CFGetTypeID(num) != CFNumberGetTypeID()) return false;
  int64_t v = 0;
  if (!CFNumberGetValue(num, kCFNumberSInt64Type, &v)) return false;
  out = static_cast<uint64_t>(v);
  return true;
}

static std::string bsd_name_of(io_registry_entry_t driver, int index) {
  std::string name = "disk" + std::to_string(index);
  io_registry_entry_t media = IO_OBJECT_NULL;
  if (IORegistryEntryGetChildEntry(driver, kIOServicePlane, &media) != KERN_SUCCESS) return name;
  auto bsd = static_cast<CFStringRef>(IORegistryEntryCreateCFProperty(media, CFSTR(kIOBSDNameKey), kCFAllocatorDefault, 0));
  if (bsd) {
    char buf[64];
    if (CFGetTypeID(bsd) == CFStringGetTypeID() && CFStringGetCString(bsd, buf, sizeof(buf), kCFStringEncodingUTF8))
      name = buf;
    CFRelease(bsd);
  }
  IOObjectRelease(media);
  return name;
}

void DarwinCounterSource::read_disks(std::vector<harbor::model::DiskDev>& out) {
  out.clear();
  CFMutableDictionaryRef matching = IOServiceMatching(kIOBlockStorageDriverClass);
  if (!matching) return;
  io_iterator_t iter = IO_OBJECT_NULL;
  // IOServiceGetMatchingServices consumes the matching dictionary
  if (IOServiceGetMatchingServices(kIOMainPortDefault, matching, &iter) != KERN_SUCCESS) return;
  io_registry_entry_t driver = IO_OBJECT_NULL;
  int index = 0;
  while ((driver = IOIteratorNext(iter)) != IO_OBJECT_NULL) {
    auto stats = static_cast<CFDictionaryRef>(IORegistryEntryCreateCFProperty(
        driver, CFSTR(kIOBlockStorageDriverStatisticsKey), kCFAllocatorDefault, 0));
    if (stats) {
      harbor::model::DiskDev d;
      d.name = bsd_name_of(driver, index);
      if (CFGetTypeID(stats) == CFDictionaryGetTypeID()) {
        (void)dict_u64(stats, CFSTR(kIOBlockStorageDriverStatisticsBytesReadKey), d.read_bytes);
        (void)dict_u64(stats, CFSTR(kIOBlockStorageDriverStatisticsBytesWrittenKey), d.write_bytes);
        out.push_back(std::move(d));
      }
      CFRelease(stats);
    }
    IOObjectRelease(driver);
    ++index;
  }
  IOObjectRelease(iter);
}

bool DarwinCounterSource::sample(harbor::model::Snapshot& out) {
  out.taken = std::chrono::steady_clock::now();
  out.wall_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
  if (!read_cpu(out.cpu)) return false;
  if (!read_memory(out.mem)) return false;
  read_volumes(out.volumes);
  read_interfaces(out.interfaces);
  read_disks(out.disks);
  return true;
}

} // namespace harbor::collectors
