#include "SetupFlow.hpp"

#include "ConnectionPayload.hpp"
#include "PublicKeyDecoder.hpp"
#include "SetupErrors.hpp"
#include "SetupToken.hpp"

namespace nomad {
SetupFlow::SetupFlow(const SetupConfig& _config,
                     shared_ptr<SystemSetup> _systemSetup,
                     shared_ptr<LanAddressDetector> _addressDetector,
                     shared_ptr<QrPresenter> _qrPresenter)
    : config(_config),
      systemSetup(_systemSetup),
      addressDetector(_addressDetector),
      qrPresenter(_qrPresenter) {}

TargetAccount SetupFlow::resolveTargetAccount() {
  return AccountResolver::resolve(config.targetUser);
}

int SetupFlow::runQuickSetup() {
  if (config.skipSystemSetup) {
    LOG(INFO) << "Skipping system setup";
  } else {
    systemSetup->installDependencies();
    if (!systemSetup->ensureServiceRunning()) {
      LOG(WARNING) << "Could not confirm that the ssh daemon is running";
    }
  }

  provisionSuppliedKey();

  string host = trim(config.host);
  if (host.empty()) {
    auto detected = addressDetector->detectPrimaryIPv4();
    if (!detected) {
      STATUS << "Unable to detect a LAN IP. Please run on the server and "
                "provide --host manually.";
      return 1;
    }
    host = *detected;
  }
  int rc = showPayload(host, "Quick setup payload:", "Nomad Quick Setup");
  if (rc == 0) {
    STATUS << "Done. Scan the QR code from the Nomad app.";
  }
  return rc;
}

int SetupFlow::runGenerateQr() {
  string host = trim(config.host);
  if (host.empty() && config.autoDetect) {
    auto detected = addressDetector->detectPrimaryIPv4();
    if (detected) {
      host = *detected;
    }
  }
  if (host.empty()) {
    STATUS << "Missing host.";
    return 1;
  }
  return showPayload(host, "QR payload:", "Nomad QR");
}

int SetupFlow::runMigration() {
  string keyLine = config.pruneOnly ? "" : config.pubkey;
  if (keyLine.empty() && !config.pruneOnly && !config.pubkeyB64.empty()) {
    auto decoded = decodeKey(config.pubkeyB64);
    if (decoded) {
      keyLine = *decoded;
    } else {
      STATUS << "Unable to decode the base64 public key.";
    }
  }
  keyLine.erase(std::remove(keyLine.begin(), keyLine.end(), '\r'),
                keyLine.end());
  keyLine = trim(keyLine);
  if (keyLine.empty() && !config.pruneOnly) {
    STATUS << "Missing --pubkey or --pubkey-b64.";
    return 1;
  }
  if (keyLine.find('\n') != string::npos) {
    STATUS << "Error: the public key must be a single line.";
    return 1;
  }
  if (config.pruneOnly && !config.prune) {
    STATUS << "Nothing to do: --prune-only with pruning disabled.";
    return 1;
  }

  ProvisionOptions options;
  options.prunePrefix = config.prunePrefix;
  options.prune = config.prune;
  options.backup = true;

  try {
    TargetAccount account = resolveTargetAccount();
    AuthorizedKeyProvisioner provisioner(account);
    STATUS << "Updating " << account.authorizedKeysPath()
           << " (user: " << account.name << ")";

    ProvisionResult result = keyLine.empty()
                                 ? provisioner.pruneLegacyKeys(options)
                                 : provisioner.provisionKey(keyLine, options);
    if (result.backupPath) {
      STATUS << "Backup saved: " << *result.backupPath;
    }
    if (options.prune) {
      STATUS << "Removed " << result.prunedCount
             << " legacy Nomad ECDSA keys (prefix: " << options.prunePrefix
             << ")";
    }
    if (!keyLine.empty()) {
      if (result.outcome == ProvisionOutcome::Added ||
          result.outcome == ProvisionOutcome::PrunedAndAdded) {
        STATUS << "Added new public key.";
      } else {
        STATUS << "Public key already present.";
      }
    }
    LOG(INFO) << "Migration finished: " << toString(result.outcome);
  } catch (const ResolutionError& e) {
    STATUS << "Error: " << e.what();
    return 1;
  } catch (const PermissionError& e) {
    STATUS << "Error: " << e.what();
    return 1;
  } catch (const InvalidArgument& e) {
    STATUS << "Error: " << e.what();
    return 1;
  }
  return 0;
}

void SetupFlow::provisionSuppliedKey() {
  if (config.pubkeyB64.empty()) {
    return;
  }
  auto keyLine = decodeKey(config.pubkeyB64);
  if (!keyLine) {
    STATUS << "Unable to decode " << PUBKEY_ENV_VAR << ".";
    return;
  }

  // Quick setup only appends; legacy cleanup is the migration tool's job
  ProvisionOptions options;
  options.prune = false;

  try {
    TargetAccount account = resolveTargetAccount();
    STATUS << "Adding SSH public key to " << account.authorizedKeysPath()
           << " (user: " << account.name << ")";
    auto result = provisionKey(account, *keyLine, options);
    if (result.outcome == ProvisionOutcome::Added) {
      STATUS << "Added SSH public key to " << result.authorizedKeysPath;
    } else {
      STATUS << "SSH public key already exists in "
             << result.authorizedKeysPath;
    }
  } catch (const ResolutionError& e) {
    STATUS << "Warning: " << e.what() << ". Continuing without a key.";
  } catch (const PermissionError& e) {
    STATUS << "Warning: " << e.what() << ". Continuing without a key.";
  } catch (const InvalidArgument& e) {
    STATUS << "Warning: " << e.what() << ". Continuing without a key.";
  }
}

int SetupFlow::showPayload(const string& host, const string& heading,
                           const string& title) {
  string user = AccountResolver::resolveAccountName(config.user);
  try {
    payload = buildPayload(host, user, config.port, newToken());
  } catch (const InvalidArgument& e) {
    STATUS << "Error: " << e.what();
    return 1;
  }

  STATUS << heading;
  CLOG(INFO, "stdout") << *payload;

  try {
    auto presentation = qrPresenter->present(*payload, title);
    if (presentation.renderedInTerminal) {
      LOG(INFO) << "QR code rendered in terminal";
    }
  } catch (const std::runtime_error& e) {
    STATUS << "Warning: " << e.what();
  }
  return 0;
}
}  // namespace nomad
