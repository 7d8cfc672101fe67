#include "aigw/error.hpp"

#include <exception>

namespace aigw {

void rethrow_with_context(const std::string& context) {
  try {
    throw;
  } catch (const SchemaError& ex) {
    throw SchemaError(context + ": " + ex.what());
  } catch (const TranslationError& ex) {
    throw TranslationError(context + ": " + ex.what());
  } catch (const ConfigError& ex) {
    throw ConfigError(context + ": " + ex.what());
  } catch (const UpstreamError& ex) {
    throw UpstreamError(context + ": " + ex.what(), ex.status_code());
  } catch (const GatewayError& ex) {
    throw GatewayError(context + ": " + ex.what());
  }
}

}  // namespace aigw
