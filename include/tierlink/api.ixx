module;

export module tierlink.api;

// Public surface of the library in one import.
export import tierlink.expected;
export import tierlink.types;
export import tierlink.errors;
export import tierlink.config;
export import tierlink.bytes;
export import tierlink.biguint;
export import tierlink.base64url;
export import tierlink.lehmer.pool;
export import tierlink.lehmer;
export import tierlink.codec;
export import tierlink.category;
