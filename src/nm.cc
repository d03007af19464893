#include "nm.hh"

namespace nm {

StrView SecurityName(Security security) {
  switch (security) {
  case Security::WEP:
    return "wep";
  case Security::WPA:
    return "wpa";
  case Security::Enterprise:
    return "enterprise";
  case Security::None:
    break;
  }
  return "none";
}

Security ClassifySecurity(U32 flags, U32 wpa_flags, U32 rsn_flags) {
  if ((wpa_flags | rsn_flags) & kApSecurityKeyMgmt8021X) {
    return Security::Enterprise;
  }
  if (wpa_flags != 0 || rsn_flags != 0) {
    return Security::WPA;
  }
  if (flags & kApFlagPrivacy) {
    return Security::WEP;
  }
  return Security::None;
}

bool HasConnectionDefined(const Vec<Profile> &profiles) {
  for (auto &profile : profiles) {
    if (profile.IsWireless() && !profile.IsAccessPoint()) {
      return true;
    }
  }
  return false;
}

Credentials MakeCredentials(Security security, StrView identity,
                            StrView passphrase) {
  switch (security) {
  case Security::Enterprise:
    return credentials::Enterprise{.identity = Str(identity),
                                   .passphrase = Str(passphrase)};
  case Security::WPA:
    return credentials::Wpa{.passphrase = Str(passphrase)};
  case Security::WEP:
    return credentials::Wep{.key = Str(passphrase)};
  case Security::None:
    break;
  }
  return credentials::Open{};
}

} // namespace nm
