/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/uri.h
 * \brief URI references (RFC 3986): parsing, resolution against a base, and printing.
 */
#ifndef XSCHEMA_URI_H_
#define XSCHEMA_URI_H_

#include <string>

#include "support/utils.h"

namespace xschema {

/*!
 * \brief A parsed URI reference. The fragment is kept unescaped.
 */
class URI {
 public:
  URI() = default;

  /*! \brief Parse a URI reference. */
  static Result<URI> Parse(const std::string& text);

  bool IsAbs() const { return !scheme_.empty(); }

  /*! \brief Resolve a reference against this base URI. */
  URI ResolveReference(const URI& ref) const;

  /*! \brief The URI with its fragment removed. */
  URI WithoutFragment() const;

  /*! \brief The URI with the given fragment. */
  URI WithFragment(const std::string& fragment) const;

  std::string String() const;

  const std::string& Scheme() const { return scheme_; }
  /*! \brief The authority: user info, host and port. */
  const std::string& Host() const { return host_; }
  const std::string& PathPart() const { return path_; }
  /*! \brief The part after the scheme of a URI such as "urn:uuid:...". */
  const std::string& Opaque() const { return opaque_; }
  bool HasFragment() const { return has_fragment_; }
  const std::string& Fragment() const { return fragment_; }

  friend bool operator==(const URI& lhs, const URI& rhs) { return lhs.String() == rhs.String(); }
  friend bool operator!=(const URI& lhs, const URI& rhs) { return !(lhs == rhs); }

 private:
  std::string scheme_;
  bool has_authority_ = false;
  std::string host_;
  std::string path_;
  std::string opaque_;
  bool has_query_ = false;
  std::string query_;
  bool has_fragment_ = false;
  std::string fragment_;
};

/*! \brief Encode bytes as unpadded URL-safe base64. */
std::string Base64RawURLEncode(const std::string& data);

}  // namespace xschema

#endif  // XSCHEMA_URI_H_
