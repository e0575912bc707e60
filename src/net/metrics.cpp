#include "ferry/net/metrics.hpp"

#include <sstream>

namespace ferry {

Metrics::Metrics() : inner_(std::make_shared<Inner>()) {}

void Metrics::record(const TransferProgress& progress) {
  inner_->upload_now.store(progress.upload_now);
  inner_->upload_total.store(progress.upload_total);
  inner_->download_now.store(progress.download_now);
  inner_->download_total.store(progress.download_total);
  inner_->upload_speed.store(progress.upload_speed);
  inner_->download_speed.store(progress.download_speed);
  inner_->namelookup_us.store(progress.namelookup.count());
  inner_->connect_us.store(progress.connect.count());
  inner_->appconnect_us.store(progress.appconnect.count());
  inner_->pretransfer_us.store(progress.pretransfer.count());
  inner_->starttransfer_us.store(progress.starttransfer.count());
  inner_->total_us.store(progress.total.count());
  inner_->redirect_us.store(progress.redirect.count());
}

std::string Metrics::to_string() const {
  auto [up_now, up_total] = upload_progress();
  auto [down_now, down_total] = download_progress();

  std::ostringstream ss;
  ss << "upload " << up_now << "/" << up_total << " (" << upload_speed() << " B/s), "
     << "download " << down_now << "/" << down_total << " (" << download_speed() << " B/s), "
     << "namelookup " << namelookup_time().count() << "us, "
     << "connect " << connect_time().count() << "us, "
     << "appconnect " << appconnect_time().count() << "us, "
     << "pretransfer " << pretransfer_time().count() << "us, "
     << "starttransfer " << starttransfer_time().count() << "us, "
     << "total " << total_time().count() << "us, "
     << "redirect " << redirect_time().count() << "us";
  return ss.str();
}

}  // namespace ferry
