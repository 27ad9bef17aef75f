export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Error;
export import :Handle;
export import :Logging;
