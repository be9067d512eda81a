#include "../src/download_hooks.hpp"
#include "../src/url.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using downloads::Decision;
using downloads::DownloadArgs;
using downloads::DownloadHooks;

namespace {

class MemoryPaymentStore final : public storage::PaymentStore {
public:
  void add(std::uint64_t id, std::string email, std::string purchase_key) {
    by_key_[purchase_key] = id;
    by_id_[id] = storage::PaymentRecord{id, std::move(email), std::move(purchase_key)};
  }

  std::optional<std::uint64_t> find_payment_id(std::string_view purchase_key,
                                               std::string* err) const override {
    if (fail_) {
      if (err) *err = "IO error: disk gone";
      return std::nullopt;
    }
    auto it = by_key_.find(std::string(purchase_key));
    if (it == by_key_.end()) return std::nullopt;
    return it->second;
  }

  std::optional<storage::PaymentRecord> find_payment(std::uint64_t payment_id,
                                                     std::string* err) const override {
    if (fail_) {
      if (err) *err = "IO error: disk gone";
      return std::nullopt;
    }
    auto it = by_id_.find(payment_id);
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
  }

  void set_failing(bool f) { fail_ = f; }

private:
  std::map<std::string, std::uint64_t> by_key_;
  std::map<std::uint64_t, storage::PaymentRecord> by_id_;
  bool fail_ = false;
};

// Tags every link with the payment it was issued for, and tries to smuggle a
// token and option list in.
class CampaignFilter final : public downloads::UrlArgsFilter {
public:
  void filter(DownloadArgs* signed_args, std::uint64_t payment_id, const DownloadArgs& source) const override {
    util::query_set(signed_args, "campaign", "p" + std::to_string(payment_id));
    if (auto email = util::query_get(source, "email")) util::query_set(signed_args, "to", *email);
    util::query_set(signed_args, "token", "forged");
    util::query_set(signed_args, "o", "ua");
  }
};

class RecordingObserver final : public downloads::DownloadObserver {
public:
  void on_valid_download(std::string_view checked_url, const DownloadArgs& args) const override {
    urls.emplace_back(checked_url);
    last_args = args;
  }

  mutable std::vector<std::string> urls;
  mutable DownloadArgs last_args;
};

std::string query_of(const std::string& url) {
  return util::parse_url(url).query;
}

std::string replace_once(std::string s, const std::string& from, const std::string& to) {
  auto pos = s.find(from);
  assert(pos != std::string::npos);
  return s.replace(pos, from.size(), to);
}

} // namespace

int main() {
  MemoryPaymentStore payments;
  payments.add(42, "buyer@example.com", "abc123");

  signing::UrlSigner signer(std::make_shared<signing::StaticSecretProvider>("S"));
  DownloadHooks hooks(&signer, &payments, "http://shop.example.com/download");
  const signing::RequestContext buyer("203.0.113.7", "Mozilla/5.0");

  const DownloadArgs edd_args{{"download_key", "abc123"},
                              {"email", "buyer@example.com"},
                              {"file", "3"},
                              {"download", "7"},
                              {"expire", "MTcwMDAwMDAwMA%3D%3D"}};

  // URL construction: compact signed args
  auto signed_args = hooks.signed_file_url_args(edd_args, {}, buyer);
  assert(signed_args);
  assert(signed_args->size() == 3);
  assert((*signed_args)[0].first == "eddfile" && (*signed_args)[0].second == "42:7:3");
  assert((*signed_args)[1].first == "ttl" && (*signed_args)[1].second == "1700000000");
  assert((*signed_args)[2].first == "token" && (*signed_args)[2].second.size() == 64);

  const std::string url = hooks.file_url(edd_args, {}, buyer);
  assert(url.rfind("http://shop.example.com/download?eddfile=42%3A7%3A3&ttl=1700000000&token=", 0) == 0);
  assert(url == hooks.file_url(edd_args, {}, buyer));
  assert(signer.verify(url, buyer));

  // Pre-dispatch: valid request rewrites the args
  auto dd = hooks.process_download_args({}, query_of(url), buyer);
  assert(dd.decision == Decision::Valid);
  assert(dd.checked_url == url);
  assert(util::query_get(dd.args, "download").value() == "7");
  assert(util::query_get(dd.args, "file_key").value() == "3");
  assert(util::query_get(dd.args, "email").value() == "buyer@example.com");
  assert(util::query_get(dd.args, "key").value() == "abc123");
  assert(util::query_get(dd.args, "expire").value() == "1700000000");

  // Arriving on another path does not matter; home_url is what was signed.
  assert(hooks.process_download_args({}, query_of(replace_once(url, "/download", "/x/y")), buyer).decision ==
         Decision::Valid);

  // Tampered file key
  const DownloadArgs host_args{{"download", "1"}};
  auto tampered = hooks.process_download_args(host_args, query_of(replace_once(url, "42%3A7%3A3", "42%3A7%3A4")), buyer);
  assert(tampered.decision == Decision::Invalid);
  assert(tampered.args == host_args);

  // Not a signed download request
  auto plain = hooks.process_download_args(host_args, "download=1&email=x", buyer);
  assert(plain.decision == Decision::NotApplicable);
  assert(plain.args == host_args);
  assert(hooks.process_download_args({}, "eddfile=42%3A7%3A3&ttl=1", buyer).decision == Decision::NotApplicable);

  // Lookup miss and missing key leave the args unsigned
  DownloadArgs unknown = edd_args;
  util::query_set(&unknown, "download_key", "nope");
  assert(!hooks.signed_file_url_args(unknown, {}, buyer));
  assert(hooks.file_url_args(unknown, {}, buyer) == unknown);

  DownloadArgs keyless = edd_args;
  util::query_remove(&keyless, "download_key");
  assert(hooks.file_url_args(keyless, {}, buyer) == keyless);

  DownloadArgs bad_download = edd_args;
  util::query_set(&bad_download, "download", "seven");
  assert(!hooks.signed_file_url_args(bad_download, {}, buyer));

  // File keys outside the descriptor alphabet are never signed, so an issued
  // link always dispatches the file it was issued for.
  for (const char* file : {"a%41", "x%3Ay", "50%", "a b", "x:y"}) {
    DownloadArgs odd = edd_args;
    util::query_set(&odd, "file", file);
    assert(!hooks.signed_file_url_args(odd, {}, buyer));
    assert(hooks.file_url_args(odd, {}, buyer) == odd);
  }
  DownloadArgs dotted = edd_args;
  util::query_set(&dotted, "file", "setup-1.2_x86~64");
  auto dotted_url = hooks.file_url(dotted, {}, buyer);
  auto dotted_dd = hooks.process_download_args({}, query_of(dotted_url), buyer);
  assert(dotted_dd.decision == Decision::Valid);
  assert(util::query_get(dotted_dd.args, "file_key").value() == "setup-1.2_x86~64");

  // A signed eddfile carrying an escaped file key is rejected, not decoded twice.
  signing::SigningRequest forged;
  forged.base_url = "http://shop.example.com/download";
  forged.query_params = {{"eddfile", "42:7:a%41"}, {"ttl", "1700000000"}};
  auto forged_url = signer.sign(forged, buyer);
  assert(forged_url && signer.verify(forged_url->url, buyer));
  assert(hooks.process_download_args({}, query_of(forged_url->url), buyer).decision == Decision::Invalid);

  // Without expire there is no ttl, and such links are not dispatchable
  DownloadArgs no_expire = edd_args;
  util::query_remove(&no_expire, "expire");
  auto no_ttl = hooks.signed_file_url_args(no_expire, {}, buyer);
  assert(no_ttl && !util::query_get(*no_ttl, "ttl"));

  // IP-bound link
  auto bound_url = hooks.file_url(edd_args, signing::Options::parse("ip"), buyer);
  assert(bound_url.find("&o=ip&token=") != std::string::npos);
  assert(hooks.process_download_args({}, query_of(bound_url), buyer).decision == Decision::Valid);
  const signing::RequestContext elsewhere("198.51.100.9", "Mozilla/5.0");
  assert(hooks.process_download_args({}, query_of(bound_url), elsewhere).decision == Decision::Invalid);

  // A correctly signed descriptor for a payment that no longer exists
  payments.add(43, "gone@example.com", "gone-key");
  DownloadArgs gone_args = edd_args;
  util::query_set(&gone_args, "download_key", "gone-key");
  auto gone_url = hooks.file_url(gone_args, {}, buyer);
  MemoryPaymentStore empty;
  DownloadHooks fresh(&signer, &empty, "http://shop.example.com/download");
  assert(fresh.process_download_args({}, query_of(gone_url), buyer).decision == Decision::Invalid);

  // Extra visible args are signed along with the descriptor; observers see
  // every request that passes.
  DownloadHooks tagged(&signer, &payments, "http://shop.example.com/download");
  tagged.add_url_args_filter(std::make_shared<CampaignFilter>());
  auto observer = std::make_shared<RecordingObserver>();
  tagged.add_observer(observer);

  auto tagged_args = tagged.signed_file_url_args(edd_args, {}, buyer);
  assert(tagged_args);
  assert(util::query_get(*tagged_args, "campaign").value() == "p42");
  assert(util::query_get(*tagged_args, "to").value() == "buyer@example.com");
  assert(!util::query_get(*tagged_args, "o"));
  assert(tagged_args->back().first == "token" && tagged_args->back().second != "forged");

  const std::string tagged_url = tagged.url_for(*tagged_args);
  assert(signer.verify(tagged_url, buyer));
  auto tagged_dd = tagged.process_download_args({}, query_of(tagged_url), buyer);
  assert(tagged_dd.decision == Decision::Valid);
  assert(observer->urls.size() == 1 && observer->urls[0] == tagged_url);
  assert(observer->last_args == tagged_dd.args);

  assert(tagged.process_download_args({}, query_of(replace_once(tagged_url, "campaign=p42", "campaign=p1")), buyer)
           .decision == Decision::Invalid);
  assert(tagged.process_download_args({}, "download=1", buyer).decision == Decision::NotApplicable);
  assert(observer->urls.size() == 1);

  // Storage failures surface through err
  payments.set_failing(true);
  std::string err;
  assert(!hooks.signed_file_url_args(edd_args, {}, buyer, &err));
  assert(!err.empty());
  err.clear();
  auto failed = hooks.process_download_args({}, query_of(url), buyer, &err);
  assert(failed.decision == Decision::Invalid);
  assert(!err.empty());

  std::cout << "test_download_hooks passed\n";
  return 0;
}
