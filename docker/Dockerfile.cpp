# arbscan - scanner and report tool image
# Multi-stage build: compile and test, then ship the two binaries

# =============================================================================
# Stage 1: Builder
# =============================================================================
FROM ubuntu:22.04 as builder

# Prevent interactive prompts
ENV DEBIAN_FRONTEND=noninteractive

# Install build dependencies
RUN apt-get update && apt-get install -y --no-install-recommends \
    build-essential \
    cmake \
    libboost-all-dev \
    libssl-dev \
    libgtest-dev \
    && rm -rf /var/lib/apt/lists/*

WORKDIR /app

COPY CMakeLists.txt ./
COPY cpp/ ./cpp/

# Build and run the unit tests
RUN cmake -S . -B build -DCMAKE_BUILD_TYPE=Release && \
    cmake --build build -j$(nproc) && \
    ctest --test-dir build --output-on-failure

# =============================================================================
# Stage 2: Production
# =============================================================================
FROM ubuntu:22.04 as production

# Install runtime dependencies only
RUN apt-get update && apt-get install -y --no-install-recommends \
    libboost-system1.74.0 \
    libssl3 \
    ca-certificates \
    && rm -rf /var/lib/apt/lists/* \
    && useradd --create-home --shell /bin/bash appuser \
    && mkdir -p /data && chown appuser:appuser /data

WORKDIR /app

COPY --from=builder /app/build/arbscan /app/arbscan
COPY --from=builder /app/build/arbscan_report /app/arbscan_report

# Switch to non-root user
USER appuser

# Journal lives on a volume so it survives restarts
VOLUME ["/data"]

# Health check - check if process is running
HEALTHCHECK --interval=30s --timeout=10s --start-period=5s --retries=3 \
    CMD pgrep arbscan || exit 1

# Run the scanner
CMD ["./arbscan", "--journal", "/data/arbitrage.journal"]
