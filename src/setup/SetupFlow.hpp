#ifndef __NOMAD_SETUP_FLOW__
#define __NOMAD_SETUP_FLOW__

#include "AuthorizedKeyProvisioner.hpp"
#include "Headers.hpp"
#include "LanAddressDetector.hpp"
#include "QrPresenter.hpp"
#include "SetupConfig.hpp"
#include "SystemSetup.hpp"
#include "TargetAccount.hpp"

namespace nomad {
/**
 * @brief The three entry points: quick setup, QR generation and key
 * migration.
 *
 * Each run method returns the process exit code.  Only a missing host, an
 * invalid payload input, or (for migration) a missing key or failed
 * provisioning produce 1; problems in secondary steps are reported and
 * otherwise ignored.
 */
class SetupFlow {
 public:
  SetupFlow(const SetupConfig& config, shared_ptr<SystemSetup> systemSetup,
            shared_ptr<LanAddressDetector> addressDetector,
            shared_ptr<QrPresenter> qrPresenter);

  virtual ~SetupFlow() = default;

  /**
   * @brief Installs dependencies, enables ssh, provisions the supplied key,
   * detects the host and shows the payload.
   */
  int runQuickSetup();

  /**
   * @brief Shows a payload for an explicit host, or a detected one with
   * autoDetect.
   */
  int runGenerateQr();

  /**
   * @brief Backs up authorized_keys, prunes legacy keys and adds the new key.
   */
  int runMigration();

  /** @brief The payload of the last successful run. */
  const optional<string>& lastPayload() const { return payload; }

 protected:
  virtual TargetAccount resolveTargetAccount();

 private:
  void provisionSuppliedKey();
  int showPayload(const string& host, const string& heading,
                  const string& title);

  SetupConfig config;
  shared_ptr<SystemSetup> systemSetup;
  shared_ptr<LanAddressDetector> addressDetector;
  shared_ptr<QrPresenter> qrPresenter;
  optional<string> payload;
};
}  // namespace nomad

#endif  // __NOMAD_SETUP_FLOW__
