/***
 * Name: nestport::emit::EmitOptions::defaultKnownTypes
 * Purpose: Library types that decompiled sources commonly extend or implement.
 */
#include "emitter/EmitOptions.h"

namespace nestport::emit {

std::set<std::string> EmitOptions::defaultKnownTypes() {
  return {
      // java.lang
      "Object", "String", "Runnable", "Thread", "Comparable", "Iterable", "Cloneable", "AutoCloseable",
      "CharSequence", "Number", "Enum", "Record", "Throwable", "Exception", "RuntimeException", "Error",
      "IllegalArgumentException", "IllegalStateException", "UnsupportedOperationException",
      // java.util and java.util.function
      "Comparator", "Iterator", "Collection", "List", "Set", "Map", "AbstractList", "AbstractMap", "AbstractSet",
      "ArrayList", "HashMap", "HashSet", "LinkedList", "TimerTask", "EventListener", "Callable", "Function",
      "Supplier", "Consumer", "Predicate", "BiFunction",
  };
}

} // namespace nestport::emit
